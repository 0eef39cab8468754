/// @file src/appusage/workspace/notification.h
/// @brief Declarations for notifications.

#ifndef APPUSAGE_WORKSPACE_NOTIFICATION_H
#define APPUSAGE_WORKSPACE_NOTIFICATION_H

#include <map>
#include <memory>
#include <string>
#include "./running_application.h"

namespace appusage
{
    namespace workspace
    {
        /// @brief Name of the notification posted after an application has been launched
        extern const std::string cDidLaunchApplicationNotification;
        /// @brief Name of the notification posted after an application became frontmost
        extern const std::string cDidActivateApplicationNotification;
        /// @brief Name of the notification posted after an application has terminated
        extern const std::string cDidTerminateApplicationNotification;

        /// @brief A named event delivered through a notification center
        struct Notification
        {
            /// @brief Notification name used to match observers
            std::string Name;
            /// @brief Sender supplied key-value payload
            std::map<std::string, std::string> UserInfo;
            /// @brief Application the notification is about, null if unknown
            std::shared_ptr<const RunningApplication> Application;
        };
    }
}

#endif
