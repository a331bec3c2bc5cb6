// File: ConsoleUI.hpp
// Description: Declares the console summary printed after a report is built.

#pragma once

#include "backend/AttendancePipeline.hpp"

#include <filesystem>
#include <ostream>

namespace frontend {

class ConsoleUI {
public:
    explicit ConsoleUI(std::ostream& out);

    void render(const backend::PipelineResult& result,
                const std::filesystem::path& reportPath) const;

private:
    std::ostream& m_out;
};

}  // namespace frontend
