// File: ExportLocator.hpp
// Description: Declares discovery of the most recently modified export in the
//              download folder.

#pragma once

#include <filesystem>
#include <vector>

namespace backend {

class ExportLocator {
public:
    // Regular ".csv" files directly inside folder, in directory order.
    // Throws FatalInputError when the folder cannot be listed.
    std::vector<std::filesystem::path> listExports(const std::filesystem::path& folder) const;

    // Throws FatalInputError when the folder holds no export.
    std::filesystem::path findNewestExport(const std::filesystem::path& folder) const;
};

}  // namespace backend
