// loom/loom.h
#ifndef LOOM_LOOM_H
#define LOOM_LOOM_H

#include "core/orchestrator.h"
#include "core/types/constraints.h"
#include "core/types/error.h"
#include "core/types/plan.h"
#include "core/types/run_state.h"
#include "common/config/loom_config.h"
#include "common/llm/scripted_completion.h"
#include "common/logging/logging.h"
#include "common/tools/registry.h"
#include "modules/cache/artifact_store.h"
#include "modules/persistence/run_summary_sink.h"
#include "modules/policy/capability_manifest.h"

#endif // LOOM_LOOM_H
