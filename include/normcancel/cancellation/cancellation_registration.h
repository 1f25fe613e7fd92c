//
// Created by Jesson on 2024/10/3.
//

#ifndef CANCELLATION_REGISTRATION_H
#define CANCELLATION_REGISTRATION_H

#include "cancellation_token.h"

#include <cstdint>
#include <functional>
#include <type_traits>
#include <utility>

namespace normcancel {

namespace detail {

class cancellation_state;
struct cancellation_registration_list_chunk;
struct cancellation_registration_state;

}

class cancellation_registration {
public:
	/// Registers the callback to be executed when cancellation is requested
	/// on the cancellation_token.
	///
	/// If cancellation has already been requested the callback runs
	/// immediately, before the constructor returns. Otherwise it runs on the
	/// first thread to call cancellation_source::request_cancellation().
	/// If the token can never be cancelled nothing is registered.
	///
	/// The callback must not throw when invoked from request_cancellation();
	/// doing so terminates the process.
	///
	/// \throw std::bad_alloc
	/// If registration failed due to insufficient memory available.
	template<
		typename FUNC,
		typename = std::enable_if_t<std::is_constructible_v<std::function<void()>, FUNC&&>>>
	cancellation_registration(cancellation_token token, FUNC&& callback)
		: m_state(nullptr)
		, m_callback(std::forward<FUNC>(callback))
		, m_chunk(nullptr)
		, m_entry_id(0) {
		register_callback(std::move(token));
	}

	cancellation_registration(const cancellation_registration& other) = delete;
	cancellation_registration& operator=(const cancellation_registration& other) = delete;

	/// Deregisters the callback.
	///
	/// Once the destructor returns the callback is guaranteed not to be
	/// running and not to run later. If another thread is executing the
	/// callback right now this waits for it to finish.
	~cancellation_registration();

private:
	friend class detail::cancellation_state;
	friend struct detail::cancellation_registration_state;

	void register_callback(cancellation_token&& token);

	detail::cancellation_state* m_state;
	std::function<void()> m_callback;
	detail::cancellation_registration_list_chunk* m_chunk;
	std::uint32_t m_entry_id;
};

}

#endif //CANCELLATION_REGISTRATION_H
