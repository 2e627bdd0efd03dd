#include <catch2/catch_test_macros.hpp>
#include <fmt/core.h>
#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <unordered_set>

#include "tpool.h"

using namespace chartiles;

class Test_ThreadPool : public ThreadPool {

	public:

		static constexpr int THREADS = 4;

		inline Test_ThreadPool() : ThreadPool(THREADS) {
			for (int i=0; i<THREADS; i++) cnts[i] = 0;
		};
		inline virtual ~Test_ThreadPool() {
			stop();
			fmt::print(" - process() Histogram:\n");
			int total = 0;
			for (int i=0; i<THREADS; i++) {
				fmt::print(" - {:>2d}| {:>8d}\n", i, cnts[i]);
				total += cnts[i];
			}
			fmt::print(" -> total {}\n", total);
		}

		std::mutex mtx;
		std::unordered_set<Key> seen;
		int n_duplicate = 0;
		std::atomic_int n_created { 0 };
		std::atomic_int n_destroyed { 0 };

		// Keys divisible by this throw.
		Key failEvery = 0;

		int cnts[THREADS];

		inline virtual void process(int workerId, const Key& key) override {
			cnts[workerId] += 1;

			mtx.lock();
			n_duplicate += seen.find(key) != seen.end();
			seen.insert(key);
			mtx.unlock();

			if (failEvery and key % failEvery == 0)
				throw std::runtime_error(fmt::format("key {} failed", key));
		}
		inline virtual void* createWorkerData(int workerId) override {
			n_created++;
			return nullptr;
		}
		inline virtual void destroyWorkerData(int workerId, void* ptr) override {
			n_destroyed++;
		}

};


TEST_CASE( "tpool", "[tpool]" ) {

	Test_ThreadPool* tpool = new Test_ThreadPool();
	tpool->start();

	constexpr int N = 1<<16;
	for (int i=0; i<N; i++) tpool->enqueue(i);

	tpool->blockUntilFinished();

	REQUIRE(tpool->n_duplicate == 0);
	REQUIRE(tpool->seen.size() == N);
	REQUIRE_FALSE(tpool->hadErrors());

	delete tpool;
}

TEST_CASE( "tpool-worker-data", "[tpool]" ) {
	auto tpool = new Test_ThreadPool();
	tpool->start();
	tpool->enqueue(1);
	tpool->blockUntilFinished();
	tpool->stop();

	REQUIRE(tpool->n_created == Test_ThreadPool::THREADS);
	REQUIRE(tpool->n_destroyed == Test_ThreadPool::THREADS);
	delete tpool;
}

TEST_CASE( "tpool-errors-do-not-stop-work", "[tpool]" ) {
	auto tpool = new Test_ThreadPool();
	tpool->failEvery = 10;
	tpool->start();

	for (int i=1; i<=100; i++) tpool->enqueue(i);
	tpool->blockUntilFinished();

	// Every unit ran, including the ones after the first failure.
	REQUIRE(tpool->seen.size() == 100);
	REQUIRE(tpool->hadErrors());

	auto failed = tpool->failedKeys();
	std::sort(failed.begin(), failed.end());
	REQUIRE(failed == std::vector<Key>{10,20,30,40,50,60,70,80,90,100});

	REQUIRE_THROWS_AS(tpool->rethrowFirstError(), std::runtime_error);

	delete tpool;
}

TEST_CASE( "tpool-empty", "[tpool]" ) {
	auto tpool = new Test_ThreadPool();
	tpool->start();
	tpool->blockUntilFinished();
	REQUIRE(tpool->seen.empty());
	delete tpool;
}
