/// @file src/appusage/workspace/notification.cpp
/// @brief Definitions of the workspace notification names.

#include "./notification.h"

namespace appusage
{
    namespace workspace
    {
        const std::string cDidLaunchApplicationNotification{
            "WorkspaceDidLaunchApplicationNotification"};
        const std::string cDidActivateApplicationNotification{
            "WorkspaceDidActivateApplicationNotification"};
        const std::string cDidTerminateApplicationNotification{
            "WorkspaceDidTerminateApplicationNotification"};
    }
}
