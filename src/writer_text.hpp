#pragma once

#include "report.hpp"

#include <filesystem>
#include <ostream>

void write_summary_text(std::ostream& out, const DuplicationCounts& summary);

void write_detailed_text(
    std::ostream& out,
    const DetailedReport& report,
    const std::filesystem::path& root_path
);

void write_global_report_text(std::ostream& out, const GlobalReport& report);
