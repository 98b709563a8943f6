#pragma once

#include <vector>

#include "detect/frequency.hpp"
#include "model/findings.hpp"
#include "model/recording.hpp"

namespace comtrade_analyzer::conformance {

// Each check returns an empty list when the recording conforms.
std::vector<model::ConformanceIssue> check_channel_counts(const model::RecordingMetadata& metadata);
std::vector<model::ConformanceIssue> check_file_type(const model::RecordingMetadata& metadata);
std::vector<model::ConformanceIssue> check_missing_information(
    const model::RecordingMetadata& metadata, double expected_frequency,
    double tolerance = detect::kDefaultFrequencyToleranceHz);

// Compares the loaded data body with the declared sampling rates and checks
// that the time base increases.
std::vector<model::ConformanceIssue> check_sample_counts(const model::Recording& recording);

// Header-only checks in report order: channel counts, file type, metadata.
std::vector<model::ConformanceIssue> check_config(const model::RecordingMetadata& metadata,
                                                  double expected_frequency, double tolerance);

}  // namespace comtrade_analyzer::conformance
