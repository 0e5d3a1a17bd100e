#pragma once

#include "report.hpp"

#include <cstddef>

#include <nlohmann/json.hpp>

nlohmann::json summary_to_json(const DuplicationCounts& summary, std::size_t files_found);

nlohmann::json detailed_report_to_json(const DetailedReport& report, std::size_t files_found);

nlohmann::json global_report_to_json(const GlobalReport& report);
