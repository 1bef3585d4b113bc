#ifndef ARGOT_ARGOT_HPP
#define ARGOT_ARGOT_HPP

#include "arguments.hpp"
#include "error.hpp"
#include "parser.hpp"
#include "process.hpp"
#include "schema.hpp"
#include "tag.hpp"
#include "value.hpp"

#endif // ARGOT_ARGOT_HPP
