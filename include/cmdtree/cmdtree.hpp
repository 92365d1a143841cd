#ifndef CMDTREE_CMDTREE_HPP
#define CMDTREE_CMDTREE_HPP

#include "app.hpp"
#include "command.hpp"
#include "config.hpp"
#include "context.hpp"
#include "halt.hpp"
#include "matcher.hpp"
#include "option.hpp"
#include "parsed_options.hpp"
#include "parser.hpp"
#include "terminal.hpp"
#include "usage.hpp"
#include "wrap.hpp"

#endif // CMDTREE_CMDTREE_HPP
