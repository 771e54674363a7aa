#pragma once

#include <secure_copy/command_builder.hpp>
#include <secure_copy/confirmation_gate.hpp>
#include <secure_copy/transfer_outcome.hpp>
#include <process/process_runner.hpp>

#include <memory>

namespace SecureCopy
{
    /**
     * @brief Runs a built scp command once and turns its exit status into a TransferOutcome.
     */
    class TransferRunner
    {
      public:
        TransferRunner(std::shared_ptr<ProcessRunner> processRunner, ConfirmationPrompt confirm);

        /**
         * @brief Runs the invocation.
         *
         * In interactive mode the confirmation prompt is asked first, a decline returns
         * "User declined" without spawning anything.
         * A nonzero exit returns the complete stderr output of the child as error message.
         *
         * @param invocation The command to run.
         * @param mode Batch or interactive.
         * @return TransferOutcome
         */
        TransferOutcome run(CommandInvocation const& invocation, TransferMode mode) const;

      private:
        std::shared_ptr<ProcessRunner> processRunner_;
        ConfirmationPrompt confirm_;
    };
}
