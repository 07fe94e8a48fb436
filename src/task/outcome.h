#pragma once
#include "error/error.h"
#include "error/external_error.h"
#include <type_traits>
#include <utility>
#include <variant>

namespace tether {

/**
 * Result of a unit of work: either a value or a handle-free error. Both can cross threads.
 */
template <class Type>
class Outcome {
	public:
		Outcome(Type value) : result{std::in_place_index<0>, std::move(value)} {} // NOLINT(hicpp-explicit-conversions)
		Outcome(ExternalError error) : result{std::in_place_index<1>, std::move(error)} {} // NOLINT(hicpp-explicit-conversions)

		auto IsOk() const -> bool { return result.index() == 0; }

		// Rethrows the error if there is one
		auto Value() -> Type& {
			if (!IsOk()) {
				throw RuntimeExternalError{Error()};
			}
			return std::get<0>(result);
		}

		auto Error() const -> const ExternalError& { return std::get<1>(result); }

	private:
		std::variant<Type, ExternalError> result;
};

template <>
class Outcome<void> {
	public:
		Outcome() = default;
		Outcome(ExternalError error) : ok{false}, error{std::move(error)} {} // NOLINT(hicpp-explicit-conversions)

		auto IsOk() const -> bool { return ok; }

		void Value() {
			if (!ok) {
				throw RuntimeExternalError{error};
			}
		}

		auto Error() const -> const ExternalError& { return error; }

	private:
		bool ok = true;
		ExternalError error;
};

template <class Type>
struct IsOutcome : std::false_type {};
template <class Type>
struct IsOutcome<Outcome<Type>> : std::true_type {};

// Value type produced by a work function that returns either `Type` or `Outcome<Type>`
template <class Result>
struct OutcomeValue {
	using type = Result;
};
template <class Type>
struct OutcomeValue<Outcome<Type>> {
	using type = Type;
};

} // namespace tether
