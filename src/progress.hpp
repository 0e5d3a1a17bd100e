#pragma once

#include <cstddef>
#include <ostream>
#include <string>

std::string format_progress_bar(double ratio, std::size_t width);

// Carriage-return progress line for file loading. update() is called from a
// single reporter thread; finish() only after that thread has stopped.
class ProgressPrinter {
public:
    explicit ProgressPrinter(std::ostream& out);

    void update(std::size_t done_files, std::size_t total_files);

    // Terminates a line left open by an aborted run.
    void finish();

private:
    std::ostream& out_;
    bool line_open_ = false;
};
