#ifndef GLINT_HPP
#define GLINT_HPP

#include "glint/core/config.hpp"
#include "glint/core/term/terminal.hpp"
#include "glint/span.hpp"
#include "glint/error.hpp"
#include "glint/source.hpp"
#include "glint/line.hpp"
#include "glint/column.hpp"
#include "glint/layout.hpp"
#include "glint/merger.hpp"
#include "glint/renderer.hpp"
#include "glint/diagnostic.hpp"
#include "glint/printer.hpp"
#include "glint/narratable.hpp"
#include "glint/consumer.hpp"

#endif // GLINT_HPP
