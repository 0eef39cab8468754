#ifndef APPUSAGE_TEST_WORKSPACE_FAKE_PROC_ROOT_H
#define APPUSAGE_TEST_WORKSPACE_FAKE_PROC_ROOT_H

#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace appusage
{
    namespace workspace
    {
        /// @brief Temporary directory tree imitating /proc and an applications folder
        class FakeProcRoot
        {
        private:
            std::string mRoot;

            static int removeEntry(
                const char *path, const struct stat *, int, struct FTW *)
            {
                return std::remove(path);
            }

            void makeDirectories(const std::string &path) const
            {
                std::string _partial;
                std::size_t _position{0U};
                while (_position != std::string::npos)
                {
                    _position = path.find('/', _position + 1U);
                    _partial = path.substr(0U, _position);
                    ::mkdir(_partial.c_str(), 0755);
                }
            }

        public:
            FakeProcRoot()
            {
                char _template[] = "/tmp/appusage_test_XXXXXX";
                const char *cCreated{::mkdtemp(_template)};
                if (cCreated == nullptr)
                {
                    throw std::runtime_error("Cannot create a temporary directory.");
                }
                mRoot = cCreated;
            }

            FakeProcRoot(const FakeProcRoot &) = delete;
            FakeProcRoot &operator=(const FakeProcRoot &) = delete;

            ~FakeProcRoot()
            {
                ::nftw(mRoot.c_str(), removeEntry, 16, FTW_DEPTH | FTW_PHYS);
            }

            const std::string &GetRoot() const noexcept
            {
                return mRoot;
            }

            std::string GetProcRoot() const
            {
                return mRoot + "/proc";
            }

            /// @brief Create an application bundle below the root
            /// @returns Absolute bundle path
            std::string AddBundle(
                const std::string &relativePath,
                const std::string &infoPlist = "") const
            {
                const std::string cBundle{mRoot + "/" + relativePath};
                makeDirectories(cBundle + "/Contents/MacOS");
                if (!infoPlist.empty())
                {
                    std::ofstream _stream(cBundle + "/Contents/Info.plist");
                    _stream << infoPlist;
                }

                return cBundle;
            }

            /// @brief Register a process whose executable is the given path
            void AddProcess(pid_t processId, const std::string &executablePath) const
            {
                const std::string cDirectory{GetProcRoot() + "/" + std::to_string(processId)};
                makeDirectories(cDirectory);
                ::symlink(executablePath.c_str(), (cDirectory + "/exe").c_str());
            }

            void RemoveProcess(pid_t processId) const
            {
                const std::string cDirectory{GetProcRoot() + "/" + std::to_string(processId)};
                std::remove((cDirectory + "/exe").c_str());
                std::remove(cDirectory.c_str());
            }

            static std::string MakeInfoPlist(
                const std::vector<std::pair<std::string, std::string>> &entries)
            {
                std::string _result{
                    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
                    "<!DOCTYPE plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" "
                    "\"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">\n"
                    "<plist version=\"1.0\">\n<dict>\n"};
                for (const auto &entry : entries)
                {
                    _result += "\t<key>" + entry.first + "</key>\n";
                    _result += "\t<string>" + entry.second + "</string>\n";
                }
                _result += "</dict>\n</plist>\n";

                return _result;
            }
        };
    }
}

#endif
