#include "LinkExtractor.hpp"
#include <lexbor/html/html.h>
#include <stdexcept>
#include "../utils/Logger.hpp"
#include "../utils/UrlUtil.hpp"

namespace LinkScope {

struct ExtractorState {
    lxb_html_tokenizer_t* tokenizer = nullptr;
    LinkExtractor::LinkCallback on_link;
    bool stopped = false;
    bool finished = false;
    size_t emitted = 0;
};

namespace {

std::string to_std_string(const lxb_char_t* lxb_str, size_t len) {
    if (lxb_str && len > 0) {
        return std::string(reinterpret_cast<const char*>(lxb_str), len);
    }
    return "";
}

lxb_html_token_t* OnTokenDone(lxb_html_tokenizer_t* tkz, lxb_html_token_t* token, void* ctx) {
    auto* state = static_cast<ExtractorState*>(ctx);

    if (token->tag_id == LXB_TAG__TEXT || token->tag_id == LXB_TAG__EM_COMMENT ||
        token->tag_id == LXB_TAG__EM_DOCTYPE || token->tag_id == LXB_TAG__END_OF_FILE) {
        return token;
    }
    if (token->type & LXB_HTML_TOKEN_TYPE_CLOSE) {
        return token;
    }

    // Without a tree builder the tokenizer does not know about raw text elements;
    // switch it so that "<" inside <script> or <style> is not read as a tag.
    lxb_html_tokenizer_set_state_by_tag(tkz, false, token->tag_id, LXB_NS_HTML);

    const lxb_tag_id_t tag = token->tag_id;
    if (tag != LXB_TAG_A && tag != LXB_TAG_SCRIPT && tag != LXB_TAG_LINK) {
        return token;
    }
    const bool accept_src = tag != LXB_TAG_A;

    for (lxb_html_token_attr_t* attr = token->attr_first; attr != nullptr; attr = attr->next) {
        size_t name_len = 0;
        const lxb_char_t* name = lxb_html_token_attr_name(attr, &name_len);
        std::string key = UrlUtil::ToLower(to_std_string(name, name_len));
        if (key == "href" || (accept_src && key == "src")) {
            ++state->emitted;
            // Exceptions must not unwind through the C tokenizer; a null token stops it.
            try {
                state->on_link(to_std_string(attr->value, attr->value_size));
            } catch (const std::exception& e) {
                Logger::Log(LogLevel::Error, "Link handler failed: " + std::string(e.what()));
                return nullptr;
            }
        }
    }
    return token;
}

} // anonymous namespace

LinkExtractor::LinkExtractor(LinkCallback on_link) : state_(std::make_unique<ExtractorState>()) {
    state_->on_link = std::move(on_link);
    state_->tokenizer = lxb_html_tokenizer_create();
    if (lxb_html_tokenizer_init(state_->tokenizer) != LXB_STATUS_OK) {
        lxb_html_tokenizer_destroy(state_->tokenizer);
        throw std::runtime_error("Failed to initialize lexbor tokenizer");
    }
    lxb_html_tokenizer_callback_token_done_set(state_->tokenizer, OnTokenDone, state_.get());
    if (lxb_html_tokenizer_begin(state_->tokenizer) != LXB_STATUS_OK) {
        lxb_html_tokenizer_destroy(state_->tokenizer);
        throw std::runtime_error("Failed to start lexbor tokenizer");
    }
}

LinkExtractor::~LinkExtractor() {
    if (state_->tokenizer) {
        lxb_html_tokenizer_destroy(state_->tokenizer);
    }
}

bool LinkExtractor::Feed(const char* data, size_t size) {
    if (state_->stopped || state_->finished) return false;
    if (size == 0) return true;

    lxb_status_t status = lxb_html_tokenizer_chunk(state_->tokenizer,
        reinterpret_cast<const lxb_char_t*>(data), size);
    if (status != LXB_STATUS_OK) {
        // Partial extraction stands; the rest of the document is dropped.
        Logger::Log(LogLevel::Debug, "Tokenizer stopped with status " + std::to_string(status) +
            " after " + std::to_string(state_->emitted) + " links");
        state_->stopped = true;
        return false;
    }
    return true;
}

void LinkExtractor::Finish() {
    if (state_->finished) return;
    state_->finished = true;
    if (state_->stopped) return;
    if (lxb_html_tokenizer_end(state_->tokenizer) != LXB_STATUS_OK) {
        state_->stopped = true;
    }
}

bool LinkExtractor::Stopped() const {
    return state_->stopped;
}

size_t LinkExtractor::EmittedCount() const {
    return state_->emitted;
}

std::vector<std::string> LinkExtractor::ExtractAll(const std::string& html) {
    std::vector<std::string> links;
    LinkExtractor extractor([&links](const std::string& link) { links.push_back(link); });
    if (extractor.Feed(html)) {
        extractor.Finish();
    }
    return links;
}

}
