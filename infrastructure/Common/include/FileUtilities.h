/*
* If not stated otherwise in this file or this component's LICENSE file the
* following copyright and licenses apply:
*
* Copyright 2020 RDK Management
*
* Licensed under the Apache License, Version 2.0 (the "License");
* you may not use this file except in compliance with the License.
* You may obtain a copy of the License at
*
* http://www.apache.org/licenses/LICENSE-2.0
*
* Unless required by applicable law or agreed to in writing, software
* distributed under the License is distributed on an "AS IS" BASIS,
* WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
* See the License for the specific language governing permissions and
* limitations under the License.
*/
/*
 * File:   FileUtilities.h
 *
 */

#ifndef PODNETCOMMON_FILEUTILITIES_H
#define PODNETCOMMON_FILEUTILITIES_H

#include <string>
#include <vector>
#include <sys/stat.h>

#include <boost/optional.hpp>


namespace PodNetCommon
{

/**
 * @brief splits /a/path/to/somewhere to {a, path, to, somewhere}
 * @note This function works for both absolute and relative paths.
 */
std::vector<std::string> splitPath(const std::string& path);

/**
 * @brief Recursively creates directories. Equivalent of mkdir -p in bash.
 * @param path - a path to the directory to be created. Can be relative or absolute
 * @param mode - the file access mode to create the directory with (only applied to created directories)
 * @return true if the directories were created successfully.
 * @note Existing directories are not a cause for error.
 */
bool mkdirRecursive(const std::string& path, mode_t mode = S_IRWXU);

/**
 * @brief Returns true if path points to a file, directory or symlink.
 */
bool exists(const std::string& path);

/**
 * @brief Removes the file at the given location.
 */
bool deleteFile(const std::string& filePath);

/**
 * @brief Writes the contents to a temporary file beside @a filePath and
 * renames it into place, so readers never see a partial file.
 * @return true if the file was written
 */
bool createTextFile(const std::string& filePath, const std::string& contents,
                    mode_t mode = S_IRUSR | S_IWUSR);

/**
 * @brief Reads the entire contents of a text file.
 *
 * @return boost::none if the file couldn't be opened or read, errno is left
 * set to the reason.
 */
boost::optional<std::string> readTextFile(const std::string& filePath);

} // namespace PodNetCommon

#endif // !defined(PODNETCOMMON_FILEUTILITIES_H)
