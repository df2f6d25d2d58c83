#pragma once

// AutoViz: Autonomous Profiling & Insight Engine
// Version 1.0.0

#include "autoviz/types.h"
#include "autoviz/errors.h"
#include "autoviz/statistics.h"
#include "autoviz/column_classifier.h"
#include "autoviz/pattern_detector.h"
#include "autoviz/relationship_analyzer.h"
#include "autoviz/visualization_recommender.h"
#include "autoviz/profiler.h"
#include "autoviz/insights.h"
#include "autoviz/analytics_engine.h"
#include "autoviz/report_generator.h"
#include "autoviz/config.h"
#include "autoviz/csv_loader.h"
#include "autoviz/cli.h"

namespace autoviz {

// Version information
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

inline std::string get_version_string() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace autoviz
