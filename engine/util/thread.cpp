// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#include "thread.hpp"

#include <cerrno>
#include <system_error>

#if defined( FC_NO_THREADING )
// mutex_t::native_t ========================================================

class mutex_t::native_t
{
public:
  void lock()   {}
  void unlock() {}
};

// fc_thread_t::native_t ====================================================

class fc_thread_t::native_t
{
public:
  void launch( fc_thread_t* thr ) { thr -> run(); }
  void join() {}
};

#else
// POSIX
#include <pthread.h>

// mutex_t::native_t ========================================================

class mutex_t::native_t : private noncopyable
{
  pthread_mutex_t m;

public:
  native_t()    { pthread_mutex_init( &m, nullptr ); }
  ~native_t()   { pthread_mutex_destroy( &m ); }

  void lock()   { pthread_mutex_lock( &m ); }
  void unlock() { pthread_mutex_unlock( &m ); }
};

// fc_thread_t::native_t ====================================================

class fc_thread_t::native_t
{
  pthread_t t;

  static void* execute( void* t )
  {
    static_cast<fc_thread_t*>( t ) -> run();
    return nullptr;
  }

public:
  void launch( fc_thread_t* thr )
  {
    int rc = pthread_create( &t, nullptr, execute, thr );
    if ( rc != 0 )
    {
      throw std::system_error( rc, std::generic_category(), "Could not create thread" );
    }
  }

  void join() { pthread_join( t, nullptr ); }
};
#endif

// mutex_t::mutex_t() =======================================================

mutex_t::mutex_t() : native_handle( new native_t() )
{}

// mutex_t::~mutex_t() ======================================================

mutex_t::~mutex_t()
{ delete native_handle; }

// mutex_t::lock() ==========================================================

void mutex_t::lock()
{ native_handle -> lock(); }

// mutex_t::unlock() ========================================================

void mutex_t::unlock()
{ native_handle -> unlock(); }

// fc_thread_t::fc_thread_t() ===============================================

fc_thread_t::fc_thread_t() : native_handle( new native_t() )
{}

// fc_thread_t::~fc_thread_t() ==============================================

fc_thread_t::~fc_thread_t()
{ delete native_handle; }

// fc_thread_t::launch() ====================================================

void fc_thread_t::launch()
{ native_handle -> launch( this ); }

// fc_thread_t::wait() ======================================================

void fc_thread_t::wait()
{ native_handle -> join(); }
