#ifndef REDACTOR_ENGINE_PROCESS_VALIDATOR_HPP
#define REDACTOR_ENGINE_PROCESS_VALIDATOR_HPP

#include <chrono>
#include <string>
#include <sys/types.h>
#include "validator.hpp"

namespace redactor {
namespace engine {

/*
  ProcessValidator
  --------------------------------------------------------
  Runs `<executable> <candidate>` and reads the exit status:
  0 confirms the candidate, any other clean exit rejects it.

  - stdin and stdout of the child are bound to /dev/null,
    stderr is inherited so validator diagnostics stay visible.
  - exec failures are reported back through a close-on-exec
    pipe and surface as ValidatorInvocationError(LaunchFailed).
  - a child killed by a signal surfaces as
    ValidatorInvocationError(Crashed).
  - a child that outlives the timeout is SIGKILLed, reaped and
    counted as a rejection. A zero timeout waits forever.
*/
class ProcessValidator : public Validator {
  public:
    explicit ProcessValidator(const std::string& executable,
                              std::chrono::milliseconds timeout = std::chrono::seconds(30))
        : m_executable(executable), m_timeout(timeout) {}

    bool validate(const std::string& candidate) override;

    std::string describe() const override { return m_executable; }

    const std::string& executable() const { return m_executable; }
    std::chrono::milliseconds timeout() const { return m_timeout; }

  private:
    pid_t spawn(const std::string& candidate);
    bool waitWithTimeout(pid_t pid, int& status);
    void throwLostChild() const;

    std::string m_executable;
    std::chrono::milliseconds m_timeout;
};

} // namespace engine
} // namespace redactor

#endif // REDACTOR_ENGINE_PROCESS_VALIDATOR_HPP
