/// @file src/appusage/workspace/property_list.cpp
/// @brief Implementation for the XML property list reader.

#include "./property_list.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace appusage
{
    namespace workspace
    {
        namespace
        {
            /// @brief Forward-only cursor over the XML text
            class XmlCursor
            {
            private:
                const std::string &mText;
                std::size_t mPosition;

            public:
                explicit XmlCursor(const std::string &text) noexcept : mText{text},
                                                                      mPosition{0U}
                {
                }

                bool AtEnd() const noexcept
                {
                    return mPosition >= mText.size();
                }

                void SkipWhitespace() noexcept
                {
                    while (!AtEnd() &&
                           (mText[mPosition] == ' ' || mText[mPosition] == '\t' ||
                            mText[mPosition] == '\r' || mText[mPosition] == '\n'))
                    {
                        ++mPosition;
                    }
                }

                /// @brief Skip whitespace, comments, processing instructions and declarations
                /// @returns False if one of them is not terminated
                bool SkipMisc() noexcept
                {
                    while (true)
                    {
                        SkipWhitespace();
                        if (mText.compare(mPosition, 4U, "<!--") == 0)
                        {
                            const std::size_t cEnd{mText.find("-->", mPosition + 4U)};
                            if (cEnd == std::string::npos)
                            {
                                return false;
                            }
                            mPosition = cEnd + 3U;
                        }
                        else if (mText.compare(mPosition, 2U, "<?") == 0 ||
                                 mText.compare(mPosition, 2U, "<!") == 0)
                        {
                            const std::size_t cEnd{mText.find('>', mPosition)};
                            if (cEnd == std::string::npos)
                            {
                                return false;
                            }
                            mPosition = cEnd + 1U;
                        }
                        else
                        {
                            return true;
                        }
                    }
                }

                /// @brief Read the next tag
                /// @param name Tag name without the closing slash
                /// @param closing Set if the tag is a closing tag
                /// @param selfClosing Set if the tag is self-closing
                /// @returns False if no well-formed tag starts at the cursor
                bool ReadTag(std::string &name, bool &closing, bool &selfClosing)
                {
                    if (!SkipMisc() || AtEnd() || mText[mPosition] != '<')
                    {
                        return false;
                    }

                    const std::size_t cEnd{mText.find('>', mPosition)};
                    if (cEnd == std::string::npos)
                    {
                        return false;
                    }

                    std::string _tag{mText.substr(mPosition + 1U, cEnd - mPosition - 1U)};
                    mPosition = cEnd + 1U;

                    closing = !_tag.empty() && _tag.front() == '/';
                    if (closing)
                    {
                        _tag.erase(0U, 1U);
                    }

                    selfClosing = !_tag.empty() && _tag.back() == '/';
                    if (selfClosing)
                    {
                        _tag.pop_back();
                    }

                    // Attributes are irrelevant for property lists.
                    const std::size_t cNameEnd{_tag.find_first_of(" \t\r\n")};
                    name = _tag.substr(0U, cNameEnd);

                    return !name.empty();
                }

                /// @brief Read the character data up to a closing tag
                /// @param name Expected closing tag name
                /// @param text Raw character data
                /// @returns False if the closing tag is missing
                bool ReadText(const std::string &name, std::string &text)
                {
                    const std::string cClosingTag{"</" + name + ">"};
                    const std::size_t cEnd{mText.find(cClosingTag, mPosition)};
                    if (cEnd == std::string::npos)
                    {
                        return false;
                    }

                    text = mText.substr(mPosition, cEnd - mPosition);
                    mPosition = cEnd + cClosingTag.size();

                    return true;
                }

                /// @brief Skip a container whose opening tag has just been read
                /// @returns False if the container is not terminated
                bool SkipContainer()
                {
                    std::size_t _depth{1U};
                    while (_depth > 0U)
                    {
                        const std::size_t cStart{mText.find('<', mPosition)};
                        if (cStart == std::string::npos)
                        {
                            return false;
                        }
                        mPosition = cStart;

                        std::string _name;
                        bool _closing{false};
                        bool _selfClosing{false};
                        if (!ReadTag(_name, _closing, _selfClosing))
                        {
                            return false;
                        }

                        if (_name != "dict" && _name != "array")
                        {
                            continue;
                        }

                        if (_closing)
                        {
                            --_depth;
                        }
                        else if (!_selfClosing)
                        {
                            ++_depth;
                        }
                    }

                    return true;
                }
            };

            std::string DecodeEntities(const std::string &text)
            {
                std::string _result;
                _result.reserve(text.size());

                std::size_t _position{0U};
                while (_position < text.size())
                {
                    if (text[_position] != '&')
                    {
                        _result.push_back(text[_position]);
                        ++_position;
                        continue;
                    }

                    const std::size_t cEnd{text.find(';', _position)};
                    if (cEnd == std::string::npos)
                    {
                        _result.append(text, _position, std::string::npos);
                        break;
                    }

                    const std::string cEntity{text.substr(_position + 1U, cEnd - _position - 1U)};
                    if (cEntity == "amp")
                    {
                        _result.push_back('&');
                    }
                    else if (cEntity == "lt")
                    {
                        _result.push_back('<');
                    }
                    else if (cEntity == "gt")
                    {
                        _result.push_back('>');
                    }
                    else if (cEntity == "quot")
                    {
                        _result.push_back('"');
                    }
                    else if (cEntity == "apos")
                    {
                        _result.push_back('\'');
                    }
                    else if (cEntity.size() > 1U && cEntity.front() == '#')
                    {
                        const bool cHex{cEntity[1] == 'x' || cEntity[1] == 'X'};
                        const std::string cDigits{cEntity.substr(cHex ? 2U : 1U)};
                        unsigned long _codePoint{0U};
                        try
                        {
                            _codePoint = std::stoul(cDigits, nullptr, cHex ? 16 : 10);
                        }
                        catch (const std::exception &)
                        {
                            _result.append(text, _position, cEnd - _position + 1U);
                            _position = cEnd + 1U;
                            continue;
                        }

                        // UTF-8 encoding of the referenced code point
                        if (_codePoint < 0x80U)
                        {
                            _result.push_back(static_cast<char>(_codePoint));
                        }
                        else if (_codePoint < 0x800U)
                        {
                            _result.push_back(static_cast<char>(0xc0U | (_codePoint >> 6)));
                            _result.push_back(static_cast<char>(0x80U | (_codePoint & 0x3fU)));
                        }
                        else if (_codePoint < 0x10000U)
                        {
                            _result.push_back(static_cast<char>(0xe0U | (_codePoint >> 12)));
                            _result.push_back(static_cast<char>(0x80U | ((_codePoint >> 6) & 0x3fU)));
                            _result.push_back(static_cast<char>(0x80U | (_codePoint & 0x3fU)));
                        }
                        else
                        {
                            _result.push_back(static_cast<char>(0xf0U | (_codePoint >> 18)));
                            _result.push_back(static_cast<char>(0x80U | ((_codePoint >> 12) & 0x3fU)));
                            _result.push_back(static_cast<char>(0x80U | ((_codePoint >> 6) & 0x3fU)));
                            _result.push_back(static_cast<char>(0x80U | (_codePoint & 0x3fU)));
                        }
                    }
                    else
                    {
                        _result.append(text, _position, cEnd - _position + 1U);
                    }

                    _position = cEnd + 1U;
                }

                return _result;
            }

            core::Result<PropertyList::Dictionary> MalformedDocument()
            {
                return core::Result<PropertyList::Dictionary>::FromError(
                    MakeErrorCode(WorkspaceErrc::kPropertyListMalformed));
            }
        }

        const std::string PropertyList::cBundleIdentifierKey{"CFBundleIdentifier"};
        const std::string PropertyList::cShortVersionKey{"CFBundleShortVersionString"};
        const std::string PropertyList::cBundleVersionKey{"CFBundleVersion"};

        core::Result<PropertyList::Dictionary> PropertyList::ReadFile(
            const std::string &filePath)
        {
            std::ifstream _stream(filePath);
            if (!_stream.is_open())
            {
                return core::Result<Dictionary>::FromError(
                    MakeErrorCode(WorkspaceErrc::kPropertyListUnreadable));
            }

            std::ostringstream _document;
            _document << _stream.rdbuf();
            if (_stream.bad())
            {
                return core::Result<Dictionary>::FromError(
                    MakeErrorCode(WorkspaceErrc::kPropertyListUnreadable));
            }

            return Parse(_document.str());
        }

        core::Result<PropertyList::Dictionary> PropertyList::Parse(
            const std::string &document)
        {
            XmlCursor _cursor{document};
            std::string _name;
            bool _closing{false};
            bool _selfClosing{false};

            // Descend to the top-level dictionary through the optional <plist> root.
            do
            {
                if (!_cursor.ReadTag(_name, _closing, _selfClosing) || _closing)
                {
                    return MalformedDocument();
                }
            } while (_name == "plist");

            if (_name != "dict")
            {
                return MalformedDocument();
            }

            Dictionary _result;
            if (_selfClosing)
            {
                return core::Result<Dictionary>::FromValue(std::move(_result));
            }

            while (true)
            {
                if (!_cursor.ReadTag(_name, _closing, _selfClosing))
                {
                    return MalformedDocument();
                }

                if (_closing && _name == "dict")
                {
                    break;
                }

                if (_closing || _selfClosing || _name != "key")
                {
                    return MalformedDocument();
                }

                std::string _key;
                if (!_cursor.ReadText("key", _key))
                {
                    return MalformedDocument();
                }
                _key = DecodeEntities(_key);

                if (!_cursor.ReadTag(_name, _closing, _selfClosing) || _closing)
                {
                    return MalformedDocument();
                }

                if (_name == "true" || _name == "false")
                {
                    if (!_selfClosing)
                    {
                        std::string _ignored;
                        if (!_cursor.ReadText(_name, _ignored))
                        {
                            return MalformedDocument();
                        }
                    }
                    _result[_key] = _name;
                }
                else if (_name == "dict" || _name == "array")
                {
                    if (!_selfClosing && !_cursor.SkipContainer())
                    {
                        return MalformedDocument();
                    }
                }
                else if (_name == "string" || _name == "integer" || _name == "real" ||
                         _name == "date" || _name == "data")
                {
                    std::string _value;
                    if (!_selfClosing && !_cursor.ReadText(_name, _value))
                    {
                        return MalformedDocument();
                    }
                    _result[_key] = DecodeEntities(_value);
                }
                else
                {
                    return MalformedDocument();
                }
            }

            return core::Result<Dictionary>::FromValue(std::move(_result));
        }

        std::string PropertyList::InfoPlistPath(const std::string &bundlePath)
        {
            std::string _result{bundlePath};
            if (_result.empty() || _result.back() != '/')
            {
                _result.push_back('/');
            }
            _result += "Contents/Info.plist";

            return _result;
        }
    }
}
