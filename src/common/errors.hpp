#ifndef ODIN_COMMON_ERRORS_HPP
#define ODIN_COMMON_ERRORS_HPP

#include <sstream>
#include <stdexcept>
#include <string>

namespace Odin {
    // Raised when two phase point trees that must line up (arithmetic operands, a tree and
    // its recorded structure, an augmented point and its parameter list) do not.
    class ShapeMismatchError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    // Raised when an integration produces non-finite values or cannot make progress.
    // Never recovered inside the library.
    class SolverDivergenceError : public std::runtime_error {
    public:
        SolverDivergenceError(const std::string& message, double time)
            : std::runtime_error(format(message, time)), time_(time) {}

        [[nodiscard]] double time() const noexcept { return time_; }

    private:
        static std::string format(const std::string& message, double time)
        {
            std::ostringstream stream;
            stream << message << " (t = " << time << ")";
            return stream.str();
        }

        double time_{0.0};
    };
}

#endif // ODIN_COMMON_ERRORS_HPP
