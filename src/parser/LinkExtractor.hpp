#pragma once
#include <string>
#include <vector>
#include <memory>
#include <functional>

namespace LinkScope {

struct ExtractorState;

// Streams HTML through the lexbor tokenizer and reports raw link values as they appear:
// href on <a>, src and href on <script> and <link>.
// One instance handles one document. Feed() may be called with arbitrary chunk boundaries.
class LinkExtractor {
public:
    using LinkCallback = std::function<void(const std::string&)>;

    explicit LinkExtractor(LinkCallback on_link);
    ~LinkExtractor();

    // Non-copyable
    LinkExtractor(const LinkExtractor&) = delete;
    LinkExtractor& operator=(const LinkExtractor&) = delete;

    // Returns false once the tokenizer has stopped; later chunks are ignored.
    bool Feed(const char* data, size_t size);
    bool Feed(const std::string& chunk) { return Feed(chunk.data(), chunk.size()); }

    // Flushes the tokenizer at end of input. Safe to call more than once.
    void Finish();

    bool Stopped() const;
    size_t EmittedCount() const;

    static std::vector<std::string> ExtractAll(const std::string& html);

private:
    std::unique_ptr<ExtractorState> state_;
};

}
