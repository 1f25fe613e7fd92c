//
// Created by Jesson on 2024/10/18.
//

#include <normcancel/cancellation/cancellation_registration.h>
#include <normcancel/cancellation/cancellation_source.h>
#include <normcancel/cancellation/cancellation_token.h>
#include <normcancel/cancellation/operation_cancelled.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <ostream>
#include <thread>
#include <utility>
#include <vector>

#include "doctest/doctest.h"

namespace {

// Registers `count` no-op callbacks, enough past 16 to force a second chunk.
auto register_noops(const normcancel::cancellation_token& token, int count)
    -> std::vector<std::unique_ptr<normcancel::cancellation_registration>> {
	std::vector<std::unique_ptr<normcancel::cancellation_registration>> registrations;
	registrations.reserve(count);
	for (int i = 0; i < count; ++i) {
		registrations.push_back(std::make_unique<normcancel::cancellation_registration>(token, [] {}));
	}
	return registrations;
}

}

TEST_SUITE_BEGIN("cancellation tests");

TEST_CASE("default cancellation_token is not cancellable") {
	normcancel::cancellation_token t;
	CHECK(!t.is_cancellation_requested());
	CHECK(!t.can_be_cancelled());
}

TEST_CASE("calling request_cancellation on cancellation_source updates cancellation_token") {
	normcancel::cancellation_source s;
	normcancel::cancellation_token t = s.token();
	CHECK(t.can_be_cancelled());
	CHECK(!t.is_cancellation_requested());
	s.request_cancellation();
	CHECK(t.is_cancellation_requested());
	CHECK(t.can_be_cancelled());
}

TEST_CASE("cancellation_token can't be cancelled when last cancellation_source destructed") {
	normcancel::cancellation_token t;
	{
		normcancel::cancellation_source s;
		t = s.token();
		CHECK(t.can_be_cancelled());
	}
	CHECK(!t.can_be_cancelled());
}

TEST_CASE("cancellation_token can be cancelled when last cancellation_source destructed if cancellation already requested") {
	normcancel::cancellation_token t;
	{
		normcancel::cancellation_source s;
		t = s.token();
		CHECK(t.can_be_cancelled());
		s.request_cancellation();
	}
	CHECK(t.can_be_cancelled());
	CHECK(t.is_cancellation_requested());
}

TEST_CASE("copies of a cancellation_source keep tokens cancellable") {
	normcancel::cancellation_token t;
	{
		normcancel::cancellation_source outer;
		t = outer.token();
		normcancel::cancellation_source copy = outer;
		{
			normcancel::cancellation_source moved = std::move(outer);
			CHECK(!outer.can_be_cancelled());
			CHECK(moved.can_be_cancelled());
		}
		CHECK(t.can_be_cancelled());
		copy.request_cancellation();
	}
	CHECK(t.is_cancellation_requested());
}

TEST_CASE("tokens compare equal when they share a state") {
	normcancel::cancellation_source a;
	normcancel::cancellation_source b;
	CHECK(a.token() == a.token());
	CHECK(a.token() != b.token());
	CHECK(normcancel::cancellation_token{} == normcancel::cancellation_token{});
	CHECK(a.token() != normcancel::cancellation_token{});
}

TEST_CASE("cancellation_registration when cancellation not yet requested") {
	normcancel::cancellation_source s;

	bool callback_executed = false;
	{
		normcancel::cancellation_registration callback_registration(
		    s.token(), [&] { callback_executed = true; });
	}

	CHECK(!callback_executed);

	{
		normcancel::cancellation_registration callback_registration(
			s.token(), [&] { callback_executed = true; });

		CHECK(!callback_executed);
		s.request_cancellation();
		CHECK(callback_executed);
	}
}

TEST_CASE("throw_if_cancellation_requested") {
	normcancel::cancellation_source s;
	normcancel::cancellation_token t = s.token();

	CHECK_NOTHROW(t.throw_if_cancellation_requested());
	s.request_cancellation();
	CHECK_THROWS_AS(t.throw_if_cancellation_requested(), const normcancel::operation_cancelled&);
}

TEST_CASE("cancellation_registration called immediately when cancellation already requested") {
	normcancel::cancellation_source s;
	s.request_cancellation();

	bool executed = false;
	normcancel::cancellation_registration r{ s.token(), [&] { executed = true; } };
	CHECK(executed);
}

TEST_CASE("cancellation_registration on an uncancellable token never runs") {
	bool executed = false;
	{
		normcancel::cancellation_registration r{ normcancel::cancellation_token{}, [&] { executed = true; } };
	}
	CHECK(!executed);
}

TEST_CASE("register many callbacks"
	* doctest::description{
	"this checks the code-path that allocates the next chunk of entries "
	"in the internal data-structures, which occurs on 17th callback" }) {
	normcancel::cancellation_source s;
	auto t = s.token();

	int callback_execution_count = 0;
	std::vector<std::unique_ptr<normcancel::cancellation_registration>> registrations;
	for (int i = 0; i < 18; ++i) {
		registrations.push_back(std::make_unique<normcancel::cancellation_registration>(
			t, [&] { ++callback_execution_count; }));
	}

	s.request_cancellation();
	CHECK(callback_execution_count == 18);

	s.request_cancellation();
	CHECK(callback_execution_count == 18);
}

TEST_CASE("deregistering from inside the callback does not deadlock") {
	normcancel::cancellation_source s;
	std::unique_ptr<normcancel::cancellation_registration> self;
	bool executed = false;
	self = std::make_unique<normcancel::cancellation_registration>(s.token(), [&] {
		executed = true;
		self.reset();
	});
	s.request_cancellation();
	CHECK(executed);
	CHECK(self == nullptr);
}

TEST_CASE("concurrent registration and cancellation") {
	// Just check this runs and terminates without crashing.
	for (int i = 0; i < 100; ++i) {
		normcancel::cancellation_source source;

		auto waiter = [token = source.token()](int extra) {
			std::atomic cancelled = false;
			while (!cancelled) {
				normcancel::cancellation_registration registration{
				    token, [&] { cancelled = true; }
				};
				auto others = register_noops(token, extra);
				std::this_thread::yield();
			}
		};

		std::thread waiter1{ waiter, 17 };
		std::thread waiter2{ waiter, 16 };
		std::thread waiter3{ waiter, 16 };
		std::thread canceller{ [&source] { source.request_cancellation(); } };

		canceller.join();
		waiter1.join();
		waiter2.join();
		waiter3.join();
	}
}

TEST_CASE("cancellation registration single-threaded performance") {
	normcancel::cancellation_source s;
	constexpr int iteration_count = 100'000;
	auto start = std::chrono::high_resolution_clock::now();

	for (int i = 0; i < iteration_count; ++i) {
		normcancel::cancellation_registration r{ s.token(), [] {} };
	}

	auto end = std::chrono::high_resolution_clock::now();
	auto time1 = end - start;
	start = end;

	for (int i = 0; i < iteration_count / 10; ++i) {
		auto batch = register_noops(s.token(), 10);
	}

	end = std::chrono::high_resolution_clock::now();
	auto time2 = end - start;

	auto report = [](const char* label, auto time, std::uint64_t count) {
		auto us = std::chrono::duration_cast<std::chrono::microseconds>(time).count();
		MESSAGE(label << " took " << us << "us (" << (1000.0 * us / count) << " ns/item)");
	};

	report("Individual", time1, iteration_count);
	report("Batch10", time2, iteration_count);
}

TEST_SUITE_END();
