// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef JSON_H_9025734617832096
#define JSON_H_9025734617832096

#include <map>
#include <optional>
#include <vector>
#include "string_tools.h"


namespace psync
{
//RFC 8259
struct JsonValue
{
    enum class Type
    {
        null,    //
        boolean, //primitive types
        number,  //
        string,  //
        array,
        object,
    };

    /**/     JsonValue() {}
    explicit JsonValue(Type t)          : type(t) {}
    explicit JsonValue(bool b)          : type(Type::boolean), primVal(b ? "true" : "false") {}
    explicit JsonValue(int num)         : type(Type::number),  primVal(numberTo<std::string>(num)) {}
    explicit JsonValue(int64_t num)     : type(Type::number),  primVal(numberTo<std::string>(num)) {}
    explicit JsonValue(uint64_t num)    : type(Type::number),  primVal(numberTo<std::string>(num)) {}
    explicit JsonValue(std::string str) : type(Type::string),  primVal(std::move(str)) {}
    explicit JsonValue(const char* str) : type(Type::string),  primVal(str) {}
    explicit JsonValue(const void*) = delete; //catch usage errors e.g. const int* -> JsonValue(bool)
    explicit JsonValue(std::vector<JsonValue> items) : type(Type::array), arrayVal(std::move(items)) {}

    Type type = Type::null;
    std::string                      primVal;   //for primitive types
    std::vector<JsonValue>           arrayVal;
    std::map<std::string, JsonValue> objectVal; //sorted keys => deterministic output
};


std::string serializeJson(const JsonValue& jval,
                          const std::string& lineBreak = "\n",
                          const std::string& indent    = "    "); //noexcept


struct JsonParsingError
{
    JsonParsingError(size_t rowNo, size_t colNo) : row(rowNo), col(colNo) {}
    const size_t row; //beginning with 0
    const size_t col; //
};
JsonValue parseJson(const std::string& stream); //throw JsonParsingError

inline
std::wstring formatJsonParsingError(const JsonParsingError& e)
{
    return replaceCpy(replaceCpy<std::wstring>(L"JSON parsing error in row %x, column %y.", L"%x", numberTo<std::wstring>(e.row + 1)),
                      L"%y", numberTo<std::wstring>(e.col + 1));
}


//helper functions for JsonValue access:
inline
const JsonValue* getChildFromJsonObject(const JsonValue& jvalue, const std::string& name)
{
    if (jvalue.type != JsonValue::Type::object)
        return nullptr;

    auto it = jvalue.objectVal.find(name);
    if (it == jvalue.objectVal.end())
        return nullptr;

    return &it->second;
}


inline
std::optional<std::string> getPrimitiveFromJsonObject(const JsonValue& jvalue, const std::string& name)
{
    if (const JsonValue* childValue = getChildFromJsonObject(jvalue, name))
        if (childValue->type != JsonValue::Type::object &&
            childValue->type != JsonValue::Type::array &&
            childValue->type != JsonValue::Type::null)
            return childValue->primVal;
    return std::nullopt;
}


template <class Num> inline
std::optional<Num> getNumberFromJsonObject(const JsonValue& jvalue, const std::string& name)
{
    if (const JsonValue* childValue = getChildFromJsonObject(jvalue, name))
        if (childValue->type == JsonValue::Type::number)
            return stringTo<Num>(childValue->primVal);
    return std::nullopt;
}


inline
std::optional<bool> getBoolFromJsonObject(const JsonValue& jvalue, const std::string& name)
{
    if (const JsonValue* childValue = getChildFromJsonObject(jvalue, name))
        if (childValue->type == JsonValue::Type::boolean)
            return childValue->primVal == "true";
    return std::nullopt;
}

//---------------------- implementation ----------------------
namespace json_impl
{
inline
std::string jsonEscape(const std::string& str)
{
    std::string output;
    for (const char c : str)
        switch (c)
        {
            //*INDENT-OFF*
            case '\\': output += "\\\\"; break; //
            case  '"': output += "\\\""; break; //escaping mandatory
            case '\b': output += "\\b";  break; //
            case '\f': output += "\\f";  break; //
            case '\n': output += "\\n";  break; //prefer compact escaping
            case '\r': output += "\\r";  break; //
            case '\t': output += "\\t";  break; //
            default:
                if (static_cast<unsigned char>(c) < 32)
                {
                    const auto [high, low] = hexify(static_cast<unsigned char>(c));
                    output += "\\u00";
                    output += high;
                    output += low;
                }
                else
                    output += c;
                break;
            //*INDENT-ON*
        }
    return output;
}


inline
void serialize(const JsonValue& jval, std::string& stream,
               const std::string& lineBreak,
               const std::string& indent,
               size_t indentLevel)
{
    //unlike primitives, objects and arrays are written with line breaks between their items
    auto writeIndent = [&](size_t level)
    {
        for (size_t i = 0; i < level; ++i)
            stream += indent;
    };

    switch (jval.type)
    {
        case JsonValue::Type::null:
            stream += "null";
            break;

        case JsonValue::Type::boolean:
        case JsonValue::Type::number:
            stream += jval.primVal;
            break;

        case JsonValue::Type::string:
            stream += '"' + jsonEscape(jval.primVal) + '"';
            break;

        case JsonValue::Type::array:
            stream += '[';
            if (!jval.arrayVal.empty())
            {
                for (auto it = jval.arrayVal.begin(); it != jval.arrayVal.end(); ++it)
                {
                    if (it != jval.arrayVal.begin())
                        stream += ',';
                    stream += lineBreak;
                    writeIndent(indentLevel + 1);
                    serialize(*it, stream, lineBreak, indent, indentLevel + 1);
                }
                stream += lineBreak;
                writeIndent(indentLevel);
            }
            stream += ']';
            break;

        case JsonValue::Type::object:
            stream += '{';
            if (!jval.objectVal.empty())
            {
                for (auto it = jval.objectVal.begin(); it != jval.objectVal.end(); ++it)
                {
                    if (it != jval.objectVal.begin())
                        stream += ',';
                    stream += lineBreak;
                    writeIndent(indentLevel + 1);
                    stream += '"' + jsonEscape(it->first) + "\":";
                    if (!lineBreak.empty())
                        stream += ' ';
                    serialize(it->second, stream, lineBreak, indent, indentLevel + 1);
                }
                stream += lineBreak;
                writeIndent(indentLevel);
            }
            stream += '}';
            break;
    }
}


class JsonParser
{
public:
    explicit JsonParser(const std::string& stream) : stream_(stream) {}

    JsonValue parseDocument() //throw JsonParsingError
    {
        skipWhiteSpace();
        JsonValue jval = parseValue(0); //throw JsonParsingError
        skipWhiteSpace();
        if (pos_ != stream_.size())
            throw makeError();
        return jval;
    }

private:
    static constexpr size_t MAX_NESTING = 512;

    JsonValue parseValue(size_t depth) //throw JsonParsingError
    {
        if (depth > MAX_NESTING || pos_ >= stream_.size())
            throw makeError();

        switch (stream_[pos_])
        {
            case '{':
                return parseObject(depth);
            case '[':
                return parseArray(depth);
            case '"':
                return JsonValue(parseString());
            case 't':
                expectLiteral("true");
                return JsonValue(true);
            case 'f':
                expectLiteral("false");
                return JsonValue(false);
            case 'n':
                expectLiteral("null");
                return JsonValue();
            default:
                return parseNumber();
        }
    }

    JsonValue parseObject(size_t depth)
    {
        JsonValue jval(JsonValue::Type::object);
        ++pos_; //'{'
        skipWhiteSpace();
        if (consume('}'))
            return jval;

        for (;;)
        {
            skipWhiteSpace();
            if (pos_ >= stream_.size() || stream_[pos_] != '"')
                throw makeError();
            std::string name = parseString();

            skipWhiteSpace();
            if (!consume(':'))
                throw makeError();
            skipWhiteSpace();

            jval.objectVal.insert_or_assign(std::move(name), parseValue(depth + 1));

            skipWhiteSpace();
            if (consume('}'))
                return jval;
            if (!consume(','))
                throw makeError();
        }
    }

    JsonValue parseArray(size_t depth)
    {
        JsonValue jval(JsonValue::Type::array);
        ++pos_; //'['
        skipWhiteSpace();
        if (consume(']'))
            return jval;

        for (;;)
        {
            skipWhiteSpace();
            jval.arrayVal.push_back(parseValue(depth + 1));

            skipWhiteSpace();
            if (consume(']'))
                return jval;
            if (!consume(','))
                throw makeError();
        }
    }

    JsonValue parseNumber()
    {
        const size_t posStart = pos_;
        consume('-');

        auto skipDigits = [&]
        {
            const size_t first = pos_;
            while (pos_ < stream_.size() && isDigit(stream_[pos_]))
                ++pos_;
            return pos_ != first;
        };

        if (!skipDigits())
            throw makeError();

        if (consume('.') && !skipDigits())
            throw makeError();

        if (consume('e') || consume('E'))
        {
            if (!consume('+'))
                consume('-');
            if (!skipDigits())
                throw makeError();
        }

        JsonValue jval(JsonValue::Type::number);
        jval.primVal.assign(stream_.begin() + posStart, stream_.begin() + pos_);
        return jval;
    }

    std::string parseString()
    {
        ++pos_; //'"'
        std::string output;

        for (;;)
        {
            if (pos_ >= stream_.size())
                throw makeError();

            const char c = stream_[pos_++];
            if (c == '"')
                return output;

            if (static_cast<unsigned char>(c) < 32)
                throw makeError();

            if (c != '\\')
            {
                output += c;
                continue;
            }

            if (pos_ >= stream_.size())
                throw makeError();

            switch (const char c2 = stream_[pos_++])
            {
                //*INDENT-OFF*
                case '"':
                case '\\':
                case '/': output += c2;   break;
                case 'b': output += '\b'; break;
                case 'f': output += '\f'; break;
                case 'n': output += '\n'; break;
                case 'r': output += '\r'; break;
                case 't': output += '\t'; break;
                //*INDENT-ON*
                case 'u':
                {
                    char32_t cp = parseHex4();
                    if (0xd800 <= cp && cp < 0xdc00) //high surrogate: expect low surrogate
                    {
                        if (!(consume('\\') && consume('u')))
                            throw makeError();
                        const char32_t low = parseHex4();
                        if (!(0xdc00 <= low && low < 0xe000))
                            throw makeError();
                        cp = 0x10000 + ((cp - 0xd800) << 10) + (low - 0xdc00);
                    }
                    else if (0xdc00 <= cp && cp < 0xe000)
                        throw makeError();

                    impl::appendUtf8(output, cp);
                }
                break;

                default:
                    throw makeError();
            }
        }
    }

    char32_t parseHex4()
    {
        if (pos_ + 4 > stream_.size())
            throw makeError();

        char32_t cp = 0;
        for (size_t i = 0; i < 4; ++i)
        {
            const char c = stream_[pos_++];
            cp <<= 4;
            if      ('0' <= c && c <= '9') cp += c - '0';
            else if ('a' <= c && c <= 'f') cp += c - 'a' + 10;
            else if ('A' <= c && c <= 'F') cp += c - 'A' + 10;
            else
                throw makeError();
        }
        return cp;
    }

    void expectLiteral(std::string_view literal)
    {
        if (stream_.compare(pos_, literal.size(), literal) != 0)
            throw makeError();
        pos_ += literal.size();
    }

    bool consume(char c)
    {
        if (pos_ < stream_.size() && stream_[pos_] == c)
        {
            ++pos_;
            return true;
        }
        return false;
    }

    void skipWhiteSpace()
    {
        while (pos_ < stream_.size() &&
               (stream_[pos_] == ' ' || stream_[pos_] == '\t' || stream_[pos_] == '\r' || stream_[pos_] == '\n'))
            ++pos_;
    }

    JsonParsingError makeError() const
    {
        const size_t errorPos = std::min(pos_, stream_.size());

        size_t row = 0;
        size_t lineStart = 0;
        for (size_t i = 0; i < errorPos; ++i)
            if (stream_[i] == '\n')
            {
                ++row;
                lineStart = i + 1;
            }
        return JsonParsingError(row, errorPos - lineStart);
    }

    const std::string& stream_;
    size_t pos_ = 0;
};
}


inline
std::string serializeJson(const JsonValue& jval, const std::string& lineBreak, const std::string& indent) //noexcept
{
    std::string output;
    json_impl::serialize(jval, output, lineBreak, indent, 0);
    output += lineBreak;
    return output;
}


inline
JsonValue parseJson(const std::string& stream) //throw JsonParsingError
{
    return json_impl::JsonParser(stream).parseDocument(); //throw JsonParsingError
}
}

#endif //JSON_H_9025734617832096
