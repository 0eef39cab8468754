/// @file src/appusage/workspace/activation_translator.h
/// @brief Declarations for the activation channel translator.

#ifndef APPUSAGE_WORKSPACE_ACTIVATION_TRANSLATOR_H
#define APPUSAGE_WORKSPACE_ACTIVATION_TRANSLATOR_H

#include "./datagram_channel.h"
#include "./notification.h"
#include "./process_application.h"

namespace appusage
{
    namespace workspace
    {
        /// @brief Converts activation channel payloads into activation notifications
        /// @details The frontmost application is announced by the desktop session as a
        ///          "pid=<n>" payload. The pid is resolved to a process handle; an
        ///          unresolvable pid yields a notification without an application.
        class ActivationTranslator
        {
        private:
            std::string mProcRoot;

        public:
            /// @brief Payload key carrying the activated process ID
            static const std::string cProcessIdKey;

            /// @brief Constructor
            /// @param procRoot Root of the proc file system
            explicit ActivationTranslator(
                std::string procRoot = ProcessApplication::cDefaultProcRoot);

            /// @brief Translate an activation payload
            /// @param channelName Channel the payload arrived on
            /// @param payload Received payload
            /// @returns Activation notification
            Notification operator()(
                const std::string &channelName,
                DatagramChannel::Payload &&payload) const;
        };
    }
}

#endif
