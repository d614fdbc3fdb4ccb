#undef NDEBUG
#include<assert.h>
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/now.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"

int main() {
	auto flag1 = bool(false);
	auto flag2 = bool(false);
	auto count = 0;
	auto ec = Ev::start(Ev::yield().then([&]() {
		return Ev::concurrent(Ev::yield().then([&]() {
			flag1 = true;
			return Ev::lift();
		}));
	}).then([&]() {
		/* Concurrent task not started yet.  */
		assert(!flag1);
		flag2 = true;
		return Ev::concurrent(Ev::yield(3).then([&]() {
			++count;
			return Ev::lift();
		}));
	}).then([&]() {
		/* Give the other greenthreads a chance.  */
		return Ev::yield(10);
	}).then([&]() {
		assert(flag1);
		assert(count == 1);
		assert(Ev::now() > 0);
		return Ev::lift(0);
	}));
	assert(flag1);
	assert(flag2);

	return ec;
}
