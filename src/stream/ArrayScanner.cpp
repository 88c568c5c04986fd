#include "ArrayScanner.h"

namespace jstream::stream {

using json::TokenKind;

ArrayScanner::ArrayScanner(const json::ReaderOptions &options, bool require_array)
    : committed_(options), require_array_(require_array) {
}

void ArrayScanner::begin_chunk(std::string_view chunk, bool final_chunk) {
    chunk_ = chunk;
    chunk_offset_ = committed_.offset;
    consumed_ = 0;
    if (phase_ == Phase::Done) {
        tokenizer_.reset();
        return;
    }
    tokenizer_.emplace(chunk, final_chunk, committed_);
}

common::StreamResult<std::optional<ScannedElement>> ArrayScanner::next_element() {
    if (phase_ == Phase::Done || !tokenizer_) {
        return std::nullopt;
    }
    while (true) {
        auto more = tokenizer_->read();
        if (!more) {
            tokenizer_.reset();
            return std::unexpected(more.error());
        }
        if (!*more) {
            // Whatever follows consumed() is re-read from the next chunk.
            tokenizer_.reset();
            return std::nullopt;
        }
        TokenKind kind = tokenizer_->kind();
        if (phase_ == Phase::AwaitingArrayStart) {
            if (kind == TokenKind::ArrayStart) {
                phase_ = Phase::InsideArray;
                element_depth_ = tokenizer_->depth();
            } else if (require_array_ && json::is_value_start(kind)) {
                std::size_t offset = tokenizer_->absolute_offset(tokenizer_->token_start());
                tokenizer_.reset();
                return std::unexpected(common::syntax_error("expected a top-level array", offset));
            }
            commit();
            continue;
        }
        std::size_t depth = tokenizer_->token_depth();
        if (kind == TokenKind::ArrayEnd && depth + 1 == element_depth_) {
            phase_ = Phase::Done;
            commit();
            tokenizer_.reset();
            return std::nullopt;
        }
        if (json::is_value_start(kind) && depth == element_depth_) {
            std::size_t start = tokenizer_->token_start();
            auto skipped = tokenizer_->try_skip();
            if (!skipped) {
                tokenizer_.reset();
                return std::unexpected(skipped.error());
            }
            if (!*skipped) {
                tokenizer_.reset();
                return std::nullopt;
            }
            ScannedElement element{chunk_.substr(start, tokenizer_->position() - start), chunk_offset_ + start};
            commit();
            element_count_ += 1;
            return element;
        }
        // Comments between elements.
        commit();
    }
}

void ArrayScanner::commit() {
    tokenizer_->save_state(committed_);
    consumed_ = tokenizer_->position();
}

} // namespace jstream::stream
