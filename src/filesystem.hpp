//*****************************************************************************
// Copyright 2025 Intel Corporation
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//*****************************************************************************
#pragma once

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <istream>
#include <string>

#include "status.hpp"

namespace nexus {

namespace fs = std::filesystem;

/**
 * @brief Local disk helpers shared by the registry, the storage backends and the model loader
 */
class FileSystem {
public:
    /**
     * @brief Creates a private temporary directory under /tmp
     *
     * @param local_path set to the created directory on success
     * @return StatusCode
     */
    static StatusCode createTempPath(std::string* local_path);

    static bool isPathEscaped(const std::string& path) {
        std::size_t lhs = path.find("../");
        std::size_t rhs = path.find("/..");
        return (std::string::npos != lhs && lhs == 0) || (std::string::npos != rhs && rhs == path.length() - 3) || std::string::npos != path.find("/../") || path == "..";
    }

    static bool isAbsolutePath(const std::string& path) {
        return !path.empty() && (path[0] == '/');
    }

    static std::string joinPath(std::initializer_list<std::string> segments) {
        std::string joined;

        for (const auto& seg : segments) {
            if (joined.empty()) {
                joined = seg;
            } else if (isAbsolutePath(seg)) {
                if (joined[joined.size() - 1] == '/') {
                    joined.append(seg.substr(1));
                } else {
                    joined.append(seg);
                }
            } else {
                if (joined[joined.size() - 1] != '/') {
                    joined.append("/");
                }
                joined.append(seg);
            }
        }

        return joined;
    }

    /**
     * @brief Returns the file suffix without the leading dot, empty when there is none
     */
    static std::string getFileExtension(const std::string& path);

    static StatusCode fileExists(const std::string& path, bool* exists);

    static StatusCode isRegularFile(const std::string& path, bool* isFile);

    static StatusCode getFileSize(const std::string& path, uint64_t* size);

    static StatusCode readTextFile(const std::string& path, std::string* contents);

    static StatusCode createParentDirectories(const std::string& path);

    /**
     * @brief Replaces file contents through a sibling temporary file and rename,
     * so readers never observe a partially written file
     *
     * @param filePath
     * @param contents
     * @return Status
     */
    static Status createFileOverwrite(const std::string& filePath, const std::string& contents);

    /**
     * @brief Copies the remaining contents of input into filePath, an empty input creates an empty file
     */
    static Status writeStreamToFile(std::istream& input, const std::string& filePath);

    static StatusCode copyFile(const std::string& source, const std::string& destination);

    static StatusCode deleteFileFolder(const std::string& path);
};

}  // namespace nexus
