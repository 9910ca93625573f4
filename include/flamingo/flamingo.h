#pragma once

// =============================================================================
// Flamingo - Main Header
// =============================================================================
//
// Autotuning of compile/test command pairs over a conditional search space.
//
// Include this header for full API access.
//

#include "flamingo/common.h"
#include "flamingo/error.h"
#include "flamingo/string_util.h"
#include "flamingo/transcript.h"
#include "flamingo/tuner/cancellation.h"
#include "flamingo/tuner/command_runner.h"
#include "flamingo/tuner/command_template.h"
#include "flamingo/tuner/configuration_space.h"
#include "flamingo/tuner/evaluator.h"
#include "flamingo/tuner/optimizer.h"
#include "flamingo/tuner/result_log.h"
#include "flamingo/tuner/scoring.h"
#include "flamingo/tuner/settings.h"
#include "flamingo/tuner/strategy_registry.h"
#include "flamingo/tuner/test_record.h"
#include "flamingo/tuner/tuning_session.h"
#include "flamingo/tuner/valuation.h"
#include "flamingo/tuner/variable_tree.h"
