/// @file src/main_app_usage_post.cpp
/// @brief Command line tool that posts a key-value payload to a named channel.

#include <cstdlib>
#include <iostream>
#include <string>

#include "./application/helper/daemon_configuration.h"
#include "./appusage/workspace/datagram_channel.h"

namespace
{
    const std::string cChannelOption{"--channel"};

    void PrintUsage(const char *program)
    {
        std::cerr << "Usage: " << program << " [--channel NAME] key=value..." << std::endl;
    }
}

int main(int argc, char *argv[])
{
    const application::helper::DaemonConfiguration configuration;
    std::string channel{configuration.GetInstallRequestChannel()};
    appusage::workspace::DatagramChannel::Payload payload;

    for (int i = 1; i < argc; ++i)
    {
        const std::string argument{argv[i]};
        if (argument == cChannelOption)
        {
            if (++i == argc)
            {
                PrintUsage(argv[0]);
                return EXIT_FAILURE;
            }
            channel = argv[i];
            continue;
        }

        const std::size_t delimiter{argument.find('=')};
        if (delimiter == std::string::npos || delimiter == 0U)
        {
            PrintUsage(argv[0]);
            return EXIT_FAILURE;
        }

        payload[argument.substr(0U, delimiter)] = argument.substr(delimiter + 1U);
    }

    const auto result{appusage::workspace::DatagramChannel::Post(channel, payload)};
    if (!result.HasValue())
    {
        std::cerr << "Posting to " << channel << " failed: "
                  << result.Error().ToString() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
