/// @file src/appusage/usage/install_request_record.h
/// @brief Declarations for install request records.

#ifndef APPUSAGE_USAGE_INSTALL_REQUEST_RECORD_H
#define APPUSAGE_USAGE_INSTALL_REQUEST_RECORD_H

#include <map>
#include <string>

namespace appusage
{
    namespace usage
    {
        /// @brief Opaque install request payload as supplied by the sender
        struct InstallRequestRecord
        {
            /// @brief Key-value payload, never interpreted
            std::map<std::string, std::string> Payload;
        };
    }
}

#endif
