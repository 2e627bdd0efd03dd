#include "tpool.h"

#include <fmt/core.h>
#include <fmt/color.h>

namespace chartiles {

ThreadPool::ThreadPool(int n) {
	if (n < 1) n = 1;
	workerDatas.resize(n, nullptr);
	workerMetas.resize(n);

	// Threads call virtual methods of the derived class, so they cannot be started
	// until the derived object is fully constructed. See start().
}

void ThreadPool::start() {
	for (int i=0; i<(int)workerMetas.size(); i++) {
		WorkerMeta wm;
		wm.thread = std::thread(&ThreadPool::workerLoop, this, i);
		workerMetas[i] = std::move(wm);
	}
}

void ThreadPool::stop() {
	mtx.lock();
	doStop_ = true;
	mtx.unlock();
	cv.notify_all();

	for (auto& meta : workerMetas)
		if (meta.thread.joinable()) {
			meta.thread.join();
		}
}

ThreadPool::~ThreadPool() {
	// Subclasses must stop() in their own destructor: the workers call back into them.
	for (auto& meta : workerMetas)
		if (meta.thread.joinable())
			fmt::print(stderr, fmt::fg(fmt::color::red), " - ThreadPool destroyed with a running worker, call stop() first\n");
}

int ThreadPool::enqueue(const Key& k) {
	size_t n = 0;
	{
		std::lock_guard<std::mutex> lck(mtx);
		queuedWork.push_front(k);
		n = queuedWork.size();
	}

	// Reduce spurious wakeups in case we are pushing very fast.
	if (n < 8 or (n >= 32 and n < 40))
		cv.notify_one();
	return n;
}

void ThreadPool::workerLoop(int I) {
	workerDatas[I] = createWorkerData(I);

	while (true) {
		Key key;
		{
			std::unique_lock<std::mutex> lck(mtx);
			cv.wait(lck, [&] { return doStop_ or queuedWork.size(); });
			if (queuedWork.empty()) break; // doStop_ and nothing left.
			key = queuedWork.back();
			queuedWork.pop_back();
			inFlight_++;
		}

		std::exception_ptr err;
		try {
			process(I, key);
		} catch (const std::exception&) {
			err = std::current_exception();
		}

		{
			std::lock_guard<std::mutex> lck(mtx);
			if (err) {
				if (not firstError_) firstError_ = err;
				failedKeys_.push_back(key);
			}
			inFlight_--;
			if (inFlight_ == 0 and queuedWork.empty()) idleCv.notify_all();
		}

		// Keep other sleeping workers busy if a burst was enqueued with few notifies.
		cv.notify_one();
	}

	destroyWorkerData(I, workerDatas[I]);
	workerDatas[I] = nullptr;
}

void ThreadPool::blockUntilFinished() {
	cv.notify_all();
	std::unique_lock<std::mutex> lck(mtx);
	idleCv.wait(lck, [&] { return inFlight_ == 0 and queuedWork.empty(); });
}

bool ThreadPool::hadErrors() {
	std::lock_guard<std::mutex> lck(mtx);
	return static_cast<bool>(firstError_);
}

std::vector<Key> ThreadPool::failedKeys() {
	std::lock_guard<std::mutex> lck(mtx);
	return failedKeys_;
}

void ThreadPool::rethrowFirstError() {
	std::exception_ptr e;
	{
		std::lock_guard<std::mutex> lck(mtx);
		e = firstError_;
	}
	if (e) std::rethrow_exception(e);
}

}
