#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace iml
{
    // the categories of failure that the library reports to callers
    enum class ErrorKind {
        InvalidGeometry,
        InvalidZoom,
        NotFound,
        DuplicateLabel,
        LabelInUse,
        NothingToUndo,
        NothingToRedo,
        MalformedInput,
        UnsupportedKind,
        NUM_OPTIONS,
    };

    std::string_view to_string_view(ErrorKind);
    std::ostream& operator<<(std::ostream&, ErrorKind);

    // base class for every exception the library throws on a rejected operation
    //
    // operations that throw one of these leave their target unchanged
    class Exception : public std::runtime_error {
    public:
        ErrorKind kind() const { return kind_; }

    protected:
        Exception(ErrorKind kind, const std::string& message);

    private:
        ErrorKind kind_;
    };

    class InvalidGeometry final : public Exception {
    public:
        explicit InvalidGeometry(const std::string& message) :
            Exception{ErrorKind::InvalidGeometry, message}
        {}
    };

    class InvalidZoom final : public Exception {
    public:
        explicit InvalidZoom(const std::string& message) :
            Exception{ErrorKind::InvalidZoom, message}
        {}
    };

    class NotFound final : public Exception {
    public:
        explicit NotFound(const std::string& message) :
            Exception{ErrorKind::NotFound, message}
        {}
    };

    class DuplicateLabel final : public Exception {
    public:
        explicit DuplicateLabel(const std::string& message) :
            Exception{ErrorKind::DuplicateLabel, message}
        {}
    };

    class LabelInUse final : public Exception {
    public:
        explicit LabelInUse(const std::string& message) :
            Exception{ErrorKind::LabelInUse, message}
        {}
    };

    class NothingToUndo final : public Exception {
    public:
        NothingToUndo() :
            Exception{ErrorKind::NothingToUndo, "there is nothing to undo"}
        {}
    };

    class NothingToRedo final : public Exception {
    public:
        NothingToRedo() :
            Exception{ErrorKind::NothingToRedo, "there is nothing to redo"}
        {}
    };

    // where, in a serialized document, a codec problem was found
    struct CodecErrorLocation final {
        std::string source;  // file name or other caller-provided label (may be empty)
        std::optional<size_t> byte_offset;
        std::optional<size_t> image_index;
        std::optional<size_t> annotation_index;

        friend bool operator==(const CodecErrorLocation&, const CodecErrorLocation&) = default;
    };

    std::ostream& operator<<(std::ostream&, const CodecErrorLocation&);
    std::string to_string(const CodecErrorLocation&);

    // base class for errors raised while reading or writing an external format
    class CodecException : public Exception {
    public:
        const CodecErrorLocation& location() const { return location_; }
        const std::string& reason() const { return reason_; }

    protected:
        CodecException(ErrorKind kind, CodecErrorLocation location, std::string reason);

    private:
        CodecErrorLocation location_;
        std::string reason_;
    };

    class MalformedInput final : public CodecException {
    public:
        MalformedInput(CodecErrorLocation location, std::string reason) :
            CodecException{ErrorKind::MalformedInput, std::move(location), std::move(reason)}
        {}
    };

    class UnsupportedKind final : public CodecException {
    public:
        UnsupportedKind(CodecErrorLocation location, std::string reason) :
            CodecException{ErrorKind::UnsupportedKind, std::move(location), std::move(reason)}
        {}
    };
}
