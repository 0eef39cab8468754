/// @file src/appusage/workspace/property_list.h
/// @brief Declarations for the XML property list reader.
/// @details Application bundles describe themselves with an XML property list
///          (`Contents/Info.plist`). Only the scalar entries of the top-level
///          dictionary are of interest, so nested containers are skipped.

#ifndef APPUSAGE_WORKSPACE_PROPERTY_LIST_H
#define APPUSAGE_WORKSPACE_PROPERTY_LIST_H

#include <map>
#include <string>
#include "../core/result.h"
#include "./workspace_error_domain.h"

namespace appusage
{
    namespace workspace
    {
        /// @brief Reader of the top-level dictionary of an XML property list
        class PropertyList
        {
        public:
            /// @brief Top-level scalar entries keyed by their property name
            using Dictionary = std::map<std::string, std::string>;

            /// @brief Bundle identifier property key
            static const std::string cBundleIdentifierKey;
            /// @brief Marketing (short) version property key
            static const std::string cShortVersionKey;
            /// @brief Build (long) version property key
            static const std::string cBundleVersionKey;

            PropertyList() = delete;

            /// @brief Read and parse a property list file
            /// @param filePath Property list file path
            /// @returns Top-level scalar entries, or an error if the file is missing or malformed
            static core::Result<Dictionary> ReadFile(const std::string &filePath);

            /// @brief Parse a property list document
            /// @param document XML property list text
            /// @returns Top-level scalar entries, or an error if the document is malformed
            /// @note String, integer, real, date and data values are returned verbatim;
            ///       boolean values are returned as "true" or "false".
            static core::Result<Dictionary> Parse(const std::string &document);

            /// @brief Get the property list path of an application bundle
            /// @param bundlePath Bundle directory path
            /// @returns `<bundlePath>/Contents/Info.plist`
            static std::string InfoPlistPath(const std::string &bundlePath);
        };
    }
}

#endif
