//
// Created on 2024/11/5.
//

#include <normcancel/cancellation/cancellation_source.h>
#include <normcancel/cancellation/managed_cancellation_source.h>

#include <chrono>
#include <limits>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "doctest/doctest.h"
#include "wait_helpers.h"

using namespace std::chrono_literals;

TEST_SUITE_BEGIN("managed_cancellation_source");

TEST_CASE("fresh source is cancellable and not cancelled") {
	normcancel::managed_cancellation_source source;
	CHECK(source.can_be_cancelled());
	CHECK(!source.is_cancellation_requested());
	CHECK(source.linked_count() == 0);
	CHECK(!source.has_pending_timer());

	source.request_cancellation();
	CHECK(source.token().is_cancellation_requested());
}

TEST_CASE("dispose makes an uncancelled token uncancellable") {
	normcancel::managed_cancellation_source source;
	auto token = source.token();
	source.dispose();
	CHECK(!token.can_be_cancelled());
	CHECK(!source.can_be_cancelled());

	// Harmless after dispose.
	source.request_cancellation();
	source.dispose();
	CHECK(!token.is_cancellation_requested());
}

TEST_CASE("dispose keeps a cancelled token cancelled") {
	normcancel::managed_cancellation_source source;
	source.request_cancellation();
	auto token = source.token();
	source.dispose();
	CHECK(token.is_cancellation_requested());
}

TEST_CASE("cancel_after cancels once the delay elapses" * doctest::timeout{ 10.0 }) {
	normcancel::managed_cancellation_source source;
	source.cancel_after(20ms);
	CHECK(source.has_pending_timer());
	CHECK(normcancel::test::wait_for_cancellation(source.token()));
}

TEST_CASE("cancel_after with zero delay is accepted" * doctest::timeout{ 10.0 }) {
	normcancel::managed_cancellation_source source;
	source.cancel_after(0ms);
	CHECK(normcancel::test::wait_for_cancellation(source.token()));
}

TEST_CASE("cancel_after rejects a negative delay") {
	normcancel::managed_cancellation_source source;
	CHECK_THROWS_AS(source.cancel_after(-1ms), const std::invalid_argument&);
	CHECK_THROWS_AS(source.cancel_after(std::chrono::duration<double, std::milli>(
		std::numeric_limits<double>::quiet_NaN())), const std::invalid_argument&);
	CHECK(!source.has_pending_timer());
	CHECK(!source.is_cancellation_requested());
}

TEST_CASE("cancel_after beyond the clock range stays pending") {
	normcancel::managed_cancellation_source source;
	source.cancel_after(std::chrono::hours::max());
	CHECK(source.has_pending_timer());
	std::this_thread::sleep_for(50ms);
	CHECK(!source.is_cancellation_requested());
	CHECK(source.has_pending_timer());
}

TEST_CASE("cancel_after replaces the pending delay" * doctest::timeout{ 10.0 }) {
	SUBCASE("a later deadline postpones cancellation") {
		normcancel::managed_cancellation_source source;
		source.cancel_after(20ms);
		source.cancel_after(1h);
		std::this_thread::sleep_for(100ms);
		CHECK(!source.is_cancellation_requested());
		CHECK(source.has_pending_timer());
	}
	SUBCASE("an earlier deadline brings it forward") {
		normcancel::managed_cancellation_source source;
		source.cancel_after(1h);
		source.cancel_after(10ms);
		CHECK(normcancel::test::wait_for_cancellation(source.token()));
	}
}

TEST_CASE("cancel_after does nothing once cancelled or disposed") {
	normcancel::managed_cancellation_source cancelled;
	cancelled.request_cancellation();
	cancelled.cancel_after(1h);
	CHECK(!cancelled.has_pending_timer());

	normcancel::managed_cancellation_source disposed;
	disposed.dispose();
	disposed.cancel_after(1h);
	CHECK(!disposed.has_pending_timer());
}

TEST_CASE("dispose stops a pending timer") {
	normcancel::managed_cancellation_source source;
	auto token = source.token();
	source.cancel_after(30ms);
	source.dispose();
	CHECK(!source.has_pending_timer());
	std::this_thread::sleep_for(80ms);
	CHECK(!token.is_cancellation_requested());
	CHECK(!token.can_be_cancelled());
}

TEST_CASE("linked source follows any of its inputs") {
	normcancel::cancellation_source a;
	normcancel::cancellation_source b;
	std::vector tokens{ a.token(), b.token() };

	auto linked = normcancel::managed_cancellation_source::create_linked(tokens);
	CHECK(linked.linked_count() == 2);
	CHECK(!linked.is_cancellation_requested());

	b.request_cancellation();
	CHECK(linked.is_cancellation_requested());
	CHECK(!a.is_cancellation_requested());
}

TEST_CASE("linked source skips tokens that can never be cancelled") {
	normcancel::cancellation_source a;
	std::vector tokens{ normcancel::cancellation_token{}, a.token(), normcancel::cancellation_token{} };

	auto linked = normcancel::managed_cancellation_source::create_linked(tokens);
	CHECK(linked.linked_count() == 1);
	a.request_cancellation();
	CHECK(linked.is_cancellation_requested());
}

TEST_CASE("linked source over an already cancelled token starts cancelled") {
	normcancel::cancellation_source a;
	normcancel::cancellation_source b;
	a.request_cancellation();
	std::vector tokens{ a.token(), b.token() };

	auto linked = normcancel::managed_cancellation_source::create_linked(tokens);
	CHECK(linked.is_cancellation_requested());
}

TEST_CASE("disposing a linked source deregisters its callbacks") {
	normcancel::cancellation_source a;
	normcancel::cancellation_source b;
	std::vector tokens{ a.token(), b.token() };

	auto linked = normcancel::managed_cancellation_source::create_linked(tokens);
	auto token = linked.token();
	linked.dispose();
	CHECK(linked.linked_count() == 0);

	a.request_cancellation();
	CHECK(!token.is_cancellation_requested());
	CHECK(!token.can_be_cancelled());
}

TEST_CASE("moved linked source keeps working") {
	normcancel::cancellation_source a;
	normcancel::cancellation_source b;
	std::vector tokens{ a.token(), b.token() };

	auto linked = normcancel::managed_cancellation_source::create_linked(tokens);
	normcancel::managed_cancellation_source moved = std::move(linked);
	CHECK(moved.linked_count() == 2);

	a.request_cancellation();
	CHECK(moved.is_cancellation_requested());
}

TEST_CASE("move assignment disposes the previous contents") {
	normcancel::cancellation_source a;
	std::vector tokens{ a.token() };

	normcancel::managed_cancellation_source target;
	auto old_token = target.token();
	target = normcancel::managed_cancellation_source::create_linked(tokens);
	CHECK(!old_token.can_be_cancelled());

	a.request_cancellation();
	CHECK(target.is_cancellation_requested());
}

TEST_SUITE_END();
