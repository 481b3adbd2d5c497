#ifndef OPTBIND_OPTBIND_HPP
#define OPTBIND_OPTBIND_HPP

#include "coerce.hpp"
#include "doc.hpp"
#include "doc_tool.hpp"
#include "option.hpp"
#include "options.hpp"
#include "parser.hpp"
#include "splice.hpp"
#include "utils.hpp"
#include "value.hpp"

#endif // OPTBIND_OPTBIND_HPP
