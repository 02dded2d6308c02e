#pragma once

#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>

#include <yyjson.h>

namespace pd::json
{

// Owning handle for an immutable yyjson document.
class Document
{
  public:
    Document() = default;
    explicit Document(yyjson_doc *doc) : doc_(doc) {}
    Document(Document &&other) noexcept : doc_(other.doc_)
    {
        other.doc_ = nullptr;
    }
    Document &operator=(Document &&other) noexcept
    {
        if (this != &other)
        {
            reset();
            doc_ = other.doc_;
            other.doc_ = nullptr;
        }
        return *this;
    }
    Document(Document const &) = delete;
    Document &operator=(Document const &) = delete;

    ~Document() { reset(); }

    // On failure the returned document is invalid and `error` (when given)
    // receives the parser message with its byte offset.
    static Document parse(std::string_view payload, std::string *error = nullptr)
    {
        yyjson_read_err err{};
        auto *doc = yyjson_read_opts(const_cast<char *>(payload.data()),
                                     payload.size(), YYJSON_READ_NOFLAG,
                                     nullptr, &err);
        if (doc == nullptr && error != nullptr)
        {
            *error = describe(err);
        }
        return Document(doc);
    }

    static Document parse_file(std::filesystem::path const &path,
                               std::string *error = nullptr)
    {
        yyjson_read_err err{};
        auto *doc = yyjson_read_file(path.string().c_str(), YYJSON_READ_NOFLAG,
                                     nullptr, &err);
        if (doc == nullptr && error != nullptr)
        {
            *error = describe(err);
        }
        return Document(doc);
    }

    bool is_valid() const noexcept { return doc_ != nullptr; }
    yyjson_val *root() const noexcept
    {
        return doc_ ? yyjson_doc_get_root(doc_) : nullptr;
    }

  private:
    static std::string describe(yyjson_read_err const &err)
    {
        std::string message = err.msg ? err.msg : "unknown parse error";
        message.append(" at byte ");
        message.append(std::to_string(err.pos));
        return message;
    }

    void reset()
    {
        if (doc_)
        {
            yyjson_doc_free(doc_);
            doc_ = nullptr;
        }
    }

    yyjson_doc *doc_ = nullptr;
};

// Owning handle for a mutable yyjson document used to build output.
class MutableDocument
{
  public:
    MutableDocument() : doc_(yyjson_mut_doc_new(nullptr)) {}
    MutableDocument(MutableDocument &&other) noexcept : doc_(other.doc_)
    {
        other.doc_ = nullptr;
    }
    MutableDocument &operator=(MutableDocument &&other) noexcept
    {
        if (this != &other)
        {
            reset();
            doc_ = other.doc_;
            other.doc_ = nullptr;
        }
        return *this;
    }
    MutableDocument(MutableDocument const &) = delete;
    MutableDocument &operator=(MutableDocument const &) = delete;

    ~MutableDocument() { reset(); }

    bool is_valid() const noexcept { return doc_ != nullptr; }
    yyjson_mut_doc *doc() const noexcept { return doc_; }

    void set_root(yyjson_mut_val *value)
    {
        if (doc_)
        {
            yyjson_mut_doc_set_root(doc_, value);
        }
    }

    // Single-line output; `fallback` is returned when serialization fails.
    std::string write(char const *fallback = "{}") const
    {
        if (!doc_)
        {
            return fallback;
        }
        char *json = yyjson_mut_write(doc_, YYJSON_WRITE_NOFLAG, nullptr);
        std::string result = json ? json : fallback;
        std::free(json);
        return result;
    }

  private:
    void reset()
    {
        if (doc_)
        {
            yyjson_mut_doc_free(doc_);
            doc_ = nullptr;
        }
    }

    yyjson_mut_doc *doc_ = nullptr;
};

} // namespace pd::json
