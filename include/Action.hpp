#pragma once
#include <functional>
#include <iosfwd>
#include <string>

namespace ergon {
    // Which output streams an action must buffer instead of letting through.
    struct ActionContext {
        bool capture_out = true;
        bool capture_err = true;
    };

    struct ActionResult {
        enum class Kind {
            Success,
            Failure, // the action ran and reported failure
            Error, // the action could not run or raised
        };

        Kind kind = Kind::Success;
        std::string out; // captured stdout, empty when streamed
        std::string err; // captured stderr, empty when streamed
        std::string message;

        [[nodiscard]] bool ok() const { return kind == Kind::Success; }
    };

    /**
     * @brief One executable step of a task.
     *
     * The runner only sees this interface and never needs to know whether a step
     * is a shell command or an in-process callable.
     */
    class Action {
    public:
        virtual ~Action() = default;

        /**
         * @brief Run the step.
         * @param ctx Capture settings for stdout and stderr.
         * @return The outcome, with captured output when requested.
         * @note Never throws for a failing step; failures are reported in the result.
         */
        [[nodiscard]] virtual ActionResult execute(const ActionContext &ctx) const = 0;

        // Human readable form used in reports and clean messages.
        [[nodiscard]] virtual std::string describe() const = 0;
    };

    // Shell command run through /bin/sh -c.
    class CmdAction final : public Action {
    public:
        explicit CmdAction(std::string command);

        [[nodiscard]] ActionResult execute(const ActionContext &ctx) const override;

        [[nodiscard]] std::string describe() const override { return cmd; }

        [[nodiscard]] const std::string &command() const { return cmd; }

    private:
        std::string cmd;
    };

    // In-process step. Returning false marks the task as failed, throwing marks it as errored.
    class CallableAction final : public Action {
    public:
        using Fn = std::function<bool(std::ostream &out, std::ostream &err)>;

        CallableAction(std::string label, Fn fn);

        [[nodiscard]] ActionResult execute(const ActionContext &ctx) const override;

        [[nodiscard]] std::string describe() const override { return label; }

    private:
        std::string label;
        Fn fn;
    };
} // namespace ergon
