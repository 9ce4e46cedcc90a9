#pragma once
#ifndef HGSPIN_IO_SERVICE_POOL_HPP
#define HGSPIN_IO_SERVICE_POOL_HPP

#include <future>
#include <boost/asio/io_service.hpp>
using namespace std;
using namespace boost::asio;

//! Represents a pool of worker threads running the handlers posted to an io_service.
class io_service_pool : public io_service, public vector<future<void>>
{
public:
	//! Creates worker threads that run handlers until wait() is called.
	explicit io_service_pool(const unsigned concurrency);

	//! Lets the worker threads exit once the posted handlers complete, and waits for them.
	void wait();
private:
	unique_ptr<work> w;
};

#endif
