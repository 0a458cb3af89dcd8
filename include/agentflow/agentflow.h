// agentflow/agentflow.h
#ifndef AGENTFLOW_AGENTFLOW_H
#define AGENTFLOW_AGENTFLOW_H

#include "core/engine.h"
#include "core/types/errors.h"
#include "core/types/result.h"
#include "modules/graph/execution_plan.h"
#include "modules/graph/graph_compiler.h"
#include "modules/parser/config_parser.h"
#include "modules/scheduler/run_orchestrator.h"
#include "modules/validator/config_validator.h"

#endif // AGENTFLOW_AGENTFLOW_H
