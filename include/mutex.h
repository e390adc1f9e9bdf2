#ifndef _HANDSHAKE_MUTEX_H_
#define _HANDSHAKE_MUTEX_H_

#include <exception>
#include <utility>

#include <pthread.h>

namespace handshake {
class Mutex {
public:
  Mutex() noexcept {
    if (pthread_mutex_init(&mtx_, nullptr))
      std::terminate();
  }

  Mutex(const Mutex &) = delete;

  ~Mutex() noexcept {
    pthread_mutex_destroy(&mtx_);
  }

  Mutex &operator=(const Mutex &) = delete;

  void lock() noexcept {
    pthread_mutex_lock(&mtx_);
  }

  bool try_lock() noexcept {
    return !pthread_mutex_trylock(&mtx_);
  }

  void unlock() noexcept {
    pthread_mutex_unlock(&mtx_);
  }

private:
  pthread_mutex_t mtx_;
};

// Many readers or a single writer.
class RwLock {
public:
  RwLock() noexcept {
    if (pthread_rwlock_init(&lock_, nullptr))
      std::terminate();
  }

  RwLock(const RwLock &) = delete;

  ~RwLock() noexcept {
    pthread_rwlock_destroy(&lock_);
  }

  RwLock &operator=(const RwLock &) = delete;

  void lock() noexcept {
    pthread_rwlock_wrlock(&lock_);
  }

  void unlock() noexcept {
    pthread_rwlock_unlock(&lock_);
  }

  void lock_shared() noexcept {
    pthread_rwlock_rdlock(&lock_);
  }

  void unlock_shared() noexcept {
    pthread_rwlock_unlock(&lock_);
  }

private:
  pthread_rwlock_t lock_;
};

template <class T>
class UniqueLock {
public:
  explicit UniqueLock(T &mtx) noexcept : mtx_(&mtx) {
    mtx_->lock();
  }

  UniqueLock(const UniqueLock &) = delete;
  UniqueLock(UniqueLock &&x) noexcept
      : mtx_(x.mtx_), is_locked_(x.is_locked_) {
    x.is_locked_ = false;
    x.mtx_ = nullptr;
  }

  ~UniqueLock() noexcept {
    if (is_locked_)
      mtx_->unlock();
  }

  UniqueLock &operator=(const UniqueLock &) = delete;
  UniqueLock &operator=(UniqueLock &&x) noexcept {
    std::swap(mtx_, x.mtx_);
    std::swap(is_locked_, x.is_locked_);
    return *this;
  }

  void unlock() noexcept {
    is_locked_ = false;
    mtx_->unlock();
  }

private:
  T *mtx_;
  bool is_locked_ = true;
};

class SharedLock {
public:
  explicit SharedLock(RwLock &lock) noexcept : lock_(lock) {
    lock_.lock_shared();
  }

  SharedLock(const SharedLock &) = delete;

  ~SharedLock() noexcept {
    lock_.unlock_shared();
  }

  SharedLock &operator=(const SharedLock &) = delete;

private:
  RwLock &lock_;
};

} // namespace handshake

#endif // _HANDSHAKE_MUTEX_H_
