#include <gtest/gtest.h>

#include "libclient/ResponseDispatcher.h"
#include "qcdio/QCMutex.h"
#include "qcdio/qcstutils.h"

#include <vector>

using std::vector;
using RBS::client::ResponseDispatcher;

namespace
{

class RecordRequest : public ResponseDispatcher::Request
{
public:
	RecordRequest(
		int                 id,
		vector<int>&        order,
		QCMutex&            mutex,
		ResponseDispatcher* dispatcher)
		: mId(id),
		  mOrder(order),
		  mMutex(mutex),
		  mDispatcher(dispatcher),
		  mOnDispatcherFlag(false),
		  mDoneCount(0),
		  mRanFlag(false)
		{}
	virtual void Run()
	{
		mOnDispatcherFlag = mDispatcher && mDispatcher->IsDispatcherThread();
		QCStMutexLocker lock(mMutex);
		mOrder.push_back(mId);
	}
	virtual void Done(bool ranFlag)
	{
		mRanFlag = ranFlag;
		mDoneCount++;
	}

	int                 mId;
	vector<int>&        mOrder;
	QCMutex&            mMutex;
	ResponseDispatcher* mDispatcher;
	bool                mOnDispatcherFlag;
	int                 mDoneCount;
	bool                mRanFlag;
};

class CounterSyncRequest : public ResponseDispatcher::SyncRequest
{
public:
	CounterSyncRequest(ResponseDispatcher& dispatcher)
		: SyncRequest(),
		  mDispatcher(dispatcher),
		  mOnDispatcherFlag(false)
		{}
	virtual void Run()
		{ mOnDispatcherFlag = mDispatcher.IsDispatcherThread(); }

	ResponseDispatcher& mDispatcher;
	bool                mOnDispatcherFlag;
};

}

TEST(ResponseDispatcherTest, RunsInEnqueueOrder) {
	ResponseDispatcher dispatcher("test-dispatcher");
	dispatcher.Start();
	ASSERT_TRUE(dispatcher.IsRunning());

	QCMutex        mutex;
	vector<int>    order;
	const int      kCount = 100;
	vector<RecordRequest*> requests;
	for (int i = 0; i < kCount; i++) {
		requests.push_back(new RecordRequest(i, order, mutex, &dispatcher));
		ASSERT_TRUE(dispatcher.Enqueue(*requests.back()));
	}
	dispatcher.Stop();
	ASSERT_FALSE(dispatcher.IsRunning());
	ASSERT_EQ(dispatcher.GetProcessedCount(), kCount);
	ASSERT_EQ((int)order.size(), kCount);
	for (int i = 0; i < kCount; i++) {
		ASSERT_EQ(order[i], i);
		ASSERT_TRUE(requests[i]->mOnDispatcherFlag);
		ASSERT_TRUE(requests[i]->mRanFlag);
		ASSERT_EQ(requests[i]->mDoneCount, 1);
		delete requests[i];
	}
}

TEST(ResponseDispatcherTest, SyncRequestWaitsForCompletion) {
	ResponseDispatcher dispatcher;
	dispatcher.Start();
	ASSERT_FALSE(dispatcher.IsDispatcherThread());
	CounterSyncRequest request(dispatcher);
	ASSERT_TRUE(request.Execute(dispatcher));
	ASSERT_TRUE(request.mOnDispatcherFlag);
	// The same request can be executed again.
	request.mOnDispatcherFlag = false;
	ASSERT_TRUE(request.Execute(dispatcher));
	ASSERT_TRUE(request.mOnDispatcherFlag);
	dispatcher.Stop();
}

TEST(ResponseDispatcherTest, RejectsWhenStopped) {
	ResponseDispatcher dispatcher;
	QCMutex            mutex;
	vector<int>        order;
	RecordRequest      request(1, order, mutex, 0);
	ASSERT_FALSE(dispatcher.Enqueue(request));
	ASSERT_EQ(request.mDoneCount, 1);
	ASSERT_FALSE(request.mRanFlag);
	ASSERT_TRUE(order.empty());

	dispatcher.Start();
	dispatcher.Stop();
	CounterSyncRequest sync(dispatcher);
	ASSERT_FALSE(sync.Execute(dispatcher));
	ASSERT_FALSE(sync.mOnDispatcherFlag);
	ASSERT_EQ(dispatcher.GetProcessedCount(), 0);
}
