#ifndef ERROR_T
#define ERROR_T

#include <string>
#include <string_view>
#include <variant>

// ============================================================================
// Error Kinds
// ============================================================================

enum class ErrorKind {
	UserInput,         // bad filter, sort, command or index
	RemoteApplication, // structured error payload returned by the API
	Transport,         // connection failure, non-2xx status, malformed body
	Resource,          // local filesystem failure
	Internal,          // vocabulary tables disagree with each other
};

struct Error {
	ErrorKind kind      = ErrorKind::Internal;
	std::string message = {};
};

[[nodiscard]] constexpr std::string_view to_string(const ErrorKind kind)
{
	using namespace std::string_view_literals;

	switch (kind) {
	case ErrorKind::UserInput: return "Input error"sv;
	case ErrorKind::RemoteApplication: return "Server error"sv;
	case ErrorKind::Transport: return "Network error"sv;
	case ErrorKind::Resource: return "File error"sv;
	case ErrorKind::Internal: return "Internal error"sv;
	}
	return "Error"sv;
}

template <typename T>
using Result = std::variant<T, Error>;

template <typename T>
[[nodiscard]] const Error* error_of(const Result<T>& result)
{
	return std::get_if<Error>(&result);
}

#endif
