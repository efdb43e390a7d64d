#include "Exceptions.h"

#include <array>
#include <ostream>
#include <sstream>
#include <utility>

using namespace iml;

namespace
{
    constexpr auto c_error_kind_strings = std::to_array<std::string_view>({
        "InvalidGeometry",
        "InvalidZoom",
        "NotFound",
        "DuplicateLabel",
        "LabelInUse",
        "NothingToUndo",
        "NothingToRedo",
        "MalformedInput",
        "UnsupportedKind",
    });
    static_assert(c_error_kind_strings.size() == static_cast<size_t>(ErrorKind::NUM_OPTIONS));

    std::string format_codec_message(const CodecErrorLocation& location, const std::string& reason)
    {
        std::stringstream ss;
        ss << location << ": " << reason;
        return std::move(ss).str();
    }
}

std::string_view iml::to_string_view(ErrorKind kind)
{
    return c_error_kind_strings.at(static_cast<size_t>(kind));
}

std::ostream& iml::operator<<(std::ostream& out, ErrorKind kind)
{
    return out << to_string_view(kind);
}

iml::Exception::Exception(ErrorKind kind, const std::string& message) :
    std::runtime_error{message},
    kind_{kind}
{}

std::ostream& iml::operator<<(std::ostream& out, const CodecErrorLocation& location)
{
    out << (location.source.empty() ? std::string_view{"<input>"} : std::string_view{location.source});
    if (location.byte_offset) {
        out << " (byte " << *location.byte_offset << ')';
    }
    if (location.image_index) {
        out << " image[" << *location.image_index << ']';
    }
    if (location.annotation_index) {
        out << " annotation[" << *location.annotation_index << ']';
    }
    return out;
}

std::string iml::to_string(const CodecErrorLocation& location)
{
    std::stringstream ss;
    ss << location;
    return std::move(ss).str();
}

iml::CodecException::CodecException(ErrorKind kind, CodecErrorLocation location, std::string reason) :
    Exception{kind, format_codec_message(location, reason)},
    location_{std::move(location)},
    reason_{std::move(reason)}
{}
