// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#pragma once

#include "config.hpp"

#include "generic.hpp"

// Cross-Platform Support for Multi-Threading ===============================

class mutex_t : private noncopyable
{
private:
  class native_t;
  native_t* native_handle;

public:
  mutex_t();
  ~mutex_t();

  void lock();
  void unlock();
};

class fc_thread_t : private noncopyable
{
private:
  class native_t;
  native_t* native_handle;

protected:
  fc_thread_t();
  virtual ~fc_thread_t();

public:
  virtual void run() = 0;

  void launch();
  void wait();
};

// Scoped lock on a mutex_t
class auto_lock_t : private noncopyable
{
private:
  mutex_t& mutex;

public:
  explicit auto_lock_t( mutex_t& mutex_ ) : mutex( mutex_ ) { mutex.lock(); }
  ~auto_lock_t() { mutex.unlock(); }
};
