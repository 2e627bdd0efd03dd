#pragma once

#include <vector>
#include <deque>
#include <thread>
#include <condition_variable>
#include <mutex>
#include <exception>
#include <cstdint>

namespace chartiles {

struct WorkerMeta {
	std::thread thread;
};

using Key = uint64_t;

//
// A Thread Pool where a subclass implements the virtual process() function,
// as well as virtual functions to construct/destruct per-worker user data.
//
// Work is described by a `Key`, which is just a uint64_t: a dataset index for the reprojection
// phase, a packed TileCoordinate for the tile phase.
// Anything that is not thread-safe (GDAL dataset handles, mostly) belongs in the per-worker data.
//
// An exception escaping process() does not stop the pool. The key is recorded as failed,
// the first exception is kept, and the remaining queue is still drained.
//

class ThreadPool {

	public:
		ThreadPool(int n);
		virtual ~ThreadPool();

		virtual void process(int workerId, const Key& key) =0;
		virtual void* createWorkerData(int workerId) =0;
		virtual void destroyWorkerData(int workerId, void* ptr) =0;

		inline void* getWorkerData(int workerId) { return workerDatas[workerId]; }

		void start();
		void stop();
		int  enqueue(const Key& k);

		// Returns once the queue is empty and no worker is inside process().
		void blockUntilFinished();

		inline int getThreadCount() { return workerMetas.size(); }

		bool hadErrors();
		std::vector<Key> failedKeys();
		// Rethrows the first exception raised by process(), if any.
		void rethrowFirstError();

	private:

		std::deque<Key> queuedWork;
		int inFlight_ = 0;

		std::vector<WorkerMeta> workerMetas;
		std::vector<void*> workerDatas;

		virtual void workerLoop(int i);

		std::condition_variable cv;
		std::condition_variable idleCv;
		std::mutex mtx;

		std::exception_ptr firstError_;
		std::vector<Key> failedKeys_;

	protected:
		bool doStop_ = false;
};


}
