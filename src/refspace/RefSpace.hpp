#pragma once

#include "cache/ResolutionCache.hpp"
#include "config/EvaluatorOptions.hpp"
#include "core/Error.hpp"
#include "core/Node.hpp"
#include "directive/BuiltinDirectives.hpp"
#include "directive/Directive.hpp"
#include "directive/DirectiveRegistry.hpp"
#include "eval/EvaluationContext.hpp"
#include "eval/Evaluator.hpp"
#include "io/NodeJson.hpp"
#include "io/NodeYaml.hpp"
#include "io/Process.hpp"
#include "merge/Merge.hpp"
#include "merge/MergeOptions.hpp"
#include "path/DottedPathQuery.hpp"
#include "path/PathQuery.hpp"
#include "resolve/Reference.hpp"
#include "resolve/ResourceResolver.hpp"
#include "resolve/ScopeResolver.hpp"
