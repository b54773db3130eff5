#ifndef DAXMCP_TESTS_MOCKS_MOCK_FORMATTER_CLIENT_HPP
#define DAXMCP_TESTS_MOCKS_MOCK_FORMATTER_CLIENT_HPP

#include "daxmcp/formatter/formatter_client.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace daxmcp::testing {

// ─────────────────────────────────────────────────────────────────────────────
// MockFormatterClient - Test double for IFormatterClient
// ─────────────────────────────────────────────────────────────────────────────
// Formats deterministically: "<dax>" becomes "formatted(<dax>)". Individual
// expressions and the batch call can be scripted to fail or throw. Every
// call is recorded in order.

struct FormatterCall {
    enum class Kind { Simple, Single, Multiple };

    Kind kind;
    std::vector<std::string> dax;
    std::optional<FormattingOptions> options;
};

class MockFormatterClient final : public IFormatterClient {
public:
    [[nodiscard]] static std::string formatted_text(const std::string& dax) {
        return "formatted(" + dax + ")";
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Scripting
    // ─────────────────────────────────────────────────────────────────────────

    /// Single-expression calls for `dax` fail with `error`.
    void fail_expression(const std::string& dax, FormatterError error) {
        expression_failures_[dax] = std::move(error);
    }

    /// Single-expression calls for `dax` throw std::runtime_error(message).
    void throw_on_expression(const std::string& dax, const std::string& message) {
        expression_throws_[dax] = message;
    }

    /// Inside a batch reply, `dax` carries a syntax error instead of text.
    void reject_in_batch(const std::string& dax, DaxSyntaxError error) {
        batch_rejections_[dax] = std::move(error);
    }

    void fail_batch(FormatterError error) { batch_failure_ = std::move(error); }

    void throw_on_batch(const std::string& message) { batch_throw_ = message; }

    /// Drop the last `count` items from batch replies.
    void truncate_batch(std::size_t count) { batch_truncation_ = count; }

    // ─────────────────────────────────────────────────────────────────────────
    // Verification
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] const std::vector<FormatterCall>& calls() const noexcept { return calls_; }

    [[nodiscard]] std::size_t call_count(FormatterCall::Kind kind) const {
        std::size_t count = 0;
        for (const auto& call : calls_) {
            if (call.kind == kind) {
                ++count;
            }
        }
        return count;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // IFormatterClient Implementation
    // ─────────────────────────────────────────────────────────────────────────

    FormatterResult<DaxFormatterResponse> format(const std::string& dax) override {
        calls_.push_back({FormatterCall::Kind::Simple, {dax}, std::nullopt});
        return format_one(dax);
    }

    FormatterResult<DaxFormatterResponse> format(const FormatSingleRequest& request) override {
        calls_.push_back({FormatterCall::Kind::Single, {request.dax}, request.options});
        return format_one(request.dax);
    }

    FormatterResult<std::vector<DaxFormatterResponse>> format(
        const FormatMultipleRequest& request
    ) override {
        calls_.push_back({FormatterCall::Kind::Multiple, request.dax, request.options});

        if (batch_throw_.has_value()) {
            throw std::runtime_error(*batch_throw_);
        }
        if (batch_failure_.has_value()) {
            return tl::unexpected(*batch_failure_);
        }

        std::vector<DaxFormatterResponse> responses;
        for (const auto& dax : request.dax) {
            DaxFormatterResponse response;
            const auto rejected = batch_rejections_.find(dax);
            if (rejected != batch_rejections_.end()) {
                response.errors.push_back(rejected->second);
            } else {
                response.formatted = formatted_text(dax);
            }
            responses.push_back(std::move(response));
        }
        const std::size_t drop = std::min(batch_truncation_, responses.size());
        responses.resize(responses.size() - drop);
        return responses;
    }

private:
    FormatterResult<DaxFormatterResponse> format_one(const std::string& dax) {
        const auto thrown = expression_throws_.find(dax);
        if (thrown != expression_throws_.end()) {
            throw std::runtime_error(thrown->second);
        }
        const auto failed = expression_failures_.find(dax);
        if (failed != expression_failures_.end()) {
            return tl::unexpected(failed->second);
        }
        return DaxFormatterResponse{formatted_text(dax), {}};
    }

    std::vector<FormatterCall> calls_;
    std::map<std::string, FormatterError> expression_failures_;
    std::map<std::string, std::string> expression_throws_;
    std::map<std::string, DaxSyntaxError> batch_rejections_;
    std::optional<FormatterError> batch_failure_;
    std::optional<std::string> batch_throw_;
    std::size_t batch_truncation_{0};
};

}  // namespace daxmcp::testing

#endif  // DAXMCP_TESTS_MOCKS_MOCK_FORMATTER_CLIENT_HPP
