//--------------------------------------------------------------------------------------------------
// Copyright (c) 2020 Marcus Geelnard
//
// This software is provided 'as-is', without any express or implied warranty. In no event will the
// authors be held liable for any damages arising from the use of this software.
//
// Permission is granted to anyone to use this software for any purpose, including commercial
// applications, and to alter it and redistribute it freely, subject to the following restrictions:
//
//  1. The origin of this software must not be misrepresented; you must not claim that you wrote
//     the original software. If you use this software in a product, an acknowledgment in the
//     product documentation would be appreciated but is not required.
//
//  2. Altered source versions must be plainly marked as such, and must not be misrepresented as
//     being the original software.
//
//  3. This notice may not be removed or altered from any source distribution.
//--------------------------------------------------------------------------------------------------

#include <lease/lock_manager.hpp>

#include <base/file_utils.hpp>
#include <base/time_utils.hpp>
#include <lease/path_resolver.hpp>

#include <doctest/doctest.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <future>
#include <memory>
#include <thread>
#include <vector>

using namespace dlease;

namespace {
// A file system that forwards to the native file system, but can be told to fail.
class failing_file_system_t : public file_system_t {
public:
  failing_file_system_t() : m_native(native_file_system()) {
  }

  void create_dir(const std::string& path) override {
    m_native->create_dir(path);
  }

  time::millis_t modify_time(const std::string& path) override {
    if (vanish_before_stat.exchange(false)) {
      // Another process releases its lock right before we look at it.
      m_native->remove_file(file::append_path(path, ".uid"));
      m_native->remove_dir(path);
    }
    return m_native->modify_time(path);
  }

  void touch(const std::string& path, const time::millis_t time) override {
    ++touch_calls;
    if (touch_delay_ms > 0) {
      time::sleep_millis(touch_delay_ms);
    }
    if (fail_touch || touch_failures.fetch_sub(1) > 0) {
      throw file::file_error_t("Simulated touch failure", path, EIO);
    }
    m_native->touch(path, time);
  }

  std::string read(const std::string& path) override {
    return m_native->read(path);
  }

  void write(const std::string& data, const std::string& path) override {
    if (fail_write) {
      throw file::file_error_t("Simulated write failure", path, EIO);
    }
    m_native->write(data, path);
  }

  void remove_file(const std::string& path) override {
    m_native->remove_file(path);
  }

  void remove_dir(const std::string& path) override {
    m_native->remove_dir(path);
  }

  std::string real_path(const std::string& path) override {
    return m_native->real_path(path);
  }

  std::atomic_bool fail_touch{false};
  std::atomic_bool fail_write{false};
  std::atomic_bool vanish_before_stat{false};
  std::atomic_int touch_failures{0};
  std::atomic_int touch_calls{0};
  std::atomic_int touch_delay_ms{0};

private:
  std::shared_ptr<file_system_t> m_native;
};

// Collects the error from a compromise handler.
class compromise_catcher_t {
public:
  compromise_catcher_t() : m_promise(std::make_shared<std::promise<lock_errc_t>>()) {
    m_future = m_promise->get_future();
  }

  compromised_handler_t handler() const {
    auto promise = m_promise;
    return [promise](const lock_error_t& e) { promise->set_value(e.code()); };
  }

  bool wait(const int timeout_ms) {
    return m_future.wait_for(std::chrono::milliseconds(timeout_ms)) == std::future_status::ready;
  }

  lock_errc_t code() {
    return m_future.get();
  }

private:
  std::shared_ptr<std::promise<lock_errc_t>> m_promise;
  std::future<lock_errc_t> m_future;
};

// A temporary directory with a file to lock.
class lock_target_t {
public:
  lock_target_t() : m_dir(file::get_temp_dir(), ".d") {
    file::create_dir(m_dir.path());
    m_path = file::append_path(file::resolve_path(m_dir.path()), "target");
    file::write("data", m_path);
  }

  const std::string& path() const {
    return m_path;
  }

  std::string lock_dir() const {
    return get_lock_dir(m_path);
  }

  std::string uid_file() const {
    return get_uid_file(m_path);
  }

private:
  file::tmp_file_t m_dir;
  std::string m_path;
};

lock_options_t fast_options() {
  lock_options_t opts;
  opts.stale_ms = 2000;
  opts.update_ms = 1000;
  return opts;
}

lock_errc_t lock_error_code(lock_manager_t& manager,
                            const std::string& path,
                            const lock_options_t& opts) {
  try {
    auto lease = manager.lock(path, opts);
    FAIL("lock() should have thrown");
  } catch (const lock_error_t& e) {
    return e.code();
  }
  return lock_errc_t::IO_ERROR;
}
}  // namespace

TEST_CASE("Acquiring and releasing a lock") {
  lock_target_t target;
  lock_manager_t manager;
  const lock_options_t opts;

  SUBCASE("The lock dir and the ownership token are created and removed") {
    auto lease = manager.lock(target.path(), opts);
    CHECK(lease.has_lock());
    CHECK_EQ(lease.file(), target.path());
    CHECK(file::dir_exists(target.lock_dir()));
    CHECK_EQ(file::read(target.uid_file()), lease.uid());
    CHECK_EQ(lease.uid().size(), 36);
    CHECK(manager.is_held(target.path(), opts));
    CHECK_EQ(manager.size(), 1);

    lease.release();
    CHECK_FALSE(lease.has_lock());
    CHECK_FALSE(lease.compromised());
    CHECK_FALSE(file::dir_exists(target.lock_dir()));
    CHECK_FALSE(manager.is_held(target.path(), opts));
    CHECK_EQ(manager.size(), 0);
  }

  SUBCASE("Releasing twice is an error") {
    auto lease = manager.lock(target.path(), opts);
    lease.release();
    try {
      lease.release();
      FAIL("release() should have thrown");
    } catch (const lock_error_t& e) {
      CHECK_EQ(e.code(), lock_errc_t::RELEASED);
    }
  }

  SUBCASE("A lock that we already hold is not acquired again") {
    auto lease = manager.lock(target.path(), opts);
    CHECK_EQ(lock_error_code(manager, target.path(), opts), lock_errc_t::LOCKED);
    CHECK(lease.has_lock());
  }

  SUBCASE("The lock can be acquired again after it has been released") {
    for (int i = 0; i < 5; ++i) {
      auto lease = manager.lock(target.path(), opts);
      CHECK(lease.has_lock());
    }
    CHECK_FALSE(file::dir_exists(target.lock_dir()));
  }

  SUBCASE("Locking a missing path fails unless symbolic links are not resolved") {
    const auto missing = target.path() + ".missing";
    CHECK_EQ(lock_error_code(manager, missing, opts), lock_errc_t::NOT_FOUND);

    lock_options_t lexical;
    lexical.resolve_symlinks = false;
    auto lease = manager.lock(missing, lexical);
    CHECK(lease.has_lock());
    CHECK(file::dir_exists(get_lock_dir(missing)));
  }
}

TEST_CASE("Unlocking by path") {
  lock_target_t target;
  lock_manager_t manager;
  const lock_options_t opts;

  SUBCASE("A lock that is not held can not be unlocked") {
    try {
      manager.unlock(target.path(), opts);
      FAIL("unlock() should have thrown");
    } catch (const lock_error_t& e) {
      CHECK_EQ(e.code(), lock_errc_t::NOT_ACQUIRED);
      CHECK_EQ(to_string(e.code()), std::string("ENOTACQUIRED"));
    }
  }

  SUBCASE("A held lock is released") {
    auto lease = manager.lock(target.path(), opts);
    manager.unlock(target.path(), opts);
    CHECK_FALSE(lease.has_lock());
    CHECK_FALSE(file::dir_exists(target.lock_dir()));
    CHECK_THROWS_AS(lease.release(), lock_error_t);
  }
}

TEST_CASE("Lease ownership") {
  lock_target_t target;
  lock_manager_t manager;
  const lock_options_t opts;

  SUBCASE("A lease releases the lock when it goes out of scope") {
    {
      auto lease = manager.lock(target.path(), opts);
      CHECK(file::dir_exists(target.lock_dir()));
    }
    CHECK_FALSE(file::dir_exists(target.lock_dir()));
    CHECK_EQ(manager.size(), 0);
  }

  SUBCASE("Transferring lease ownership works as expected") {
    lease_t lease;
    CHECK_FALSE(lease.has_lock());
    {
      auto child_lease = manager.lock(target.path(), opts);
      lease = std::move(child_lease);
      CHECK_FALSE(child_lease.has_lock());
      CHECK(lease.has_lock());
    }
    CHECK(lease.has_lock());
    CHECK(file::dir_exists(target.lock_dir()));
  }

  SUBCASE("The lock manager releases all of its locks when it is destroyed") {
    lock_target_t other;
    lease_t lease;
    {
      lock_manager_t scoped_manager;
      lease = scoped_manager.lock(target.path(), opts);
      auto other_lease = scoped_manager.lock(other.path(), opts);
      other_lease = lease_t();
      CHECK_FALSE(file::dir_exists(other.lock_dir()));
      CHECK(file::dir_exists(target.lock_dir()));
    }
    CHECK_FALSE(file::dir_exists(target.lock_dir()));
    CHECK_FALSE(lease.has_lock());
  }
}

TEST_CASE("Contention between processes") {
  lock_target_t target;
  const lock_options_t opts;

  SUBCASE("A lock that is held by someone else is not acquired") {
    lock_manager_t owner;
    lock_manager_t other;
    auto lease = owner.lock(target.path(), opts);
    const auto code = lock_error_code(other, target.path(), opts);
    CHECK_EQ(code, lock_errc_t::LOCKED);
    CHECK_EQ(to_string(code), std::string("ELOCKED"));
  }

  SUBCASE("Exactly one of several concurrent contenders wins") {
    const int NUM_CONTENDERS = 8;
    std::vector<std::unique_ptr<lock_manager_t>> managers;
    std::vector<lease_t> leases(NUM_CONTENDERS);
    for (int i = 0; i < NUM_CONTENDERS; ++i) {
      managers.emplace_back(new lock_manager_t());
    }

    std::atomic_int num_locked(0);
    std::atomic_int num_rejected(0);
    std::vector<std::thread> threads;
    for (int i = 0; i < NUM_CONTENDERS; ++i) {
      threads.emplace_back([&, i] {
        try {
          leases[i] = managers[i]->lock(target.path(), opts);
          ++num_locked;
        } catch (const lock_error_t& e) {
          if (e.code() == lock_errc_t::LOCKED) {
            ++num_rejected;
          }
        }
      });
    }
    for (auto& thread : threads) {
      thread.join();
    }

    CHECK_EQ(num_locked.load(), 1);
    CHECK_EQ(num_rejected.load(), NUM_CONTENDERS - 1);
  }

  SUBCASE("A contender that retries gets the lock once it is released") {
    lock_manager_t owner;
    lock_manager_t other;
    auto lease = owner.lock(target.path(), opts);

    std::thread releaser([&lease] {
      time::sleep_millis(300);
      lease.release();
    });

    lock_options_t retry_opts;
    retry_opts.retries = retry_policy_t(10);
    retry_opts.retries.min_timeout_ms = 100;
    retry_opts.retries.factor = 1.0;
    auto other_lease = other.lock(target.path(), retry_opts);
    releaser.join();
    CHECK(other_lease.has_lock());
  }

  SUBCASE("A contender gives up when the retries are exhausted") {
    lock_manager_t owner;
    lock_manager_t other;
    auto lease = owner.lock(target.path(), opts);

    lock_options_t retry_opts;
    retry_opts.retries = retry_policy_t(2);
    retry_opts.retries.min_timeout_ms = 10;
    CHECK_EQ(lock_error_code(other, target.path(), retry_opts), lock_errc_t::LOCKED);
  }
}

TEST_CASE("Stale locks") {
  lock_target_t target;
  lock_manager_t manager;
  const lock_options_t opts;

  // Simulate a lock that was left behind by a crashed process.
  file::create_dir(target.lock_dir());
  file::write("left-behind", target.uid_file());

  SUBCASE("A fresh lock is respected") {
    CHECK_EQ(lock_error_code(manager, target.path(), opts), lock_errc_t::LOCKED);
    CHECK_EQ(file::read(target.uid_file()), std::string("left-behind"));
  }

  SUBCASE("A stale lock is reclaimed") {
    file::touch(target.lock_dir(), time::millis_since_epoch() - opts.stale_ms - 5000);
    auto lease = manager.lock(target.path(), opts);
    CHECK(lease.has_lock());
    CHECK_NE(file::read(target.uid_file()), std::string("left-behind"));
  }

  SUBCASE("A lock that disappears while it is being inspected is acquired") {
    auto fs = std::make_shared<failing_file_system_t>();
    fs->vanish_before_stat = true;
    lock_options_t vanish_opts;
    vanish_opts.fs = fs;
    auto lease = manager.lock(target.path(), vanish_opts);
    CHECK(lease.has_lock());
    CHECK_FALSE(fs->vanish_before_stat.load());
    CHECK_EQ(file::read(target.uid_file()), lease.uid());
  }

  SUBCASE("The heartbeat keeps a lock fresh") {
    file::remove_file(target.uid_file());
    file::remove_empty_dir(target.lock_dir());

    const auto fast = fast_options();
    lock_manager_t other;
    auto lease = manager.lock(target.path(), fast);
    time::sleep_millis(3000);
    CHECK(lease.has_lock());
    CHECK_EQ(lock_error_code(other, target.path(), fast), lock_errc_t::LOCKED);
  }
}

TEST_CASE("Compromised locks") {
  lock_target_t target;
  lock_manager_t manager;
  compromise_catcher_t catcher;

  SUBCASE("A lock that was reclaimed by someone else is reported as a mismatch") {
    auto lease = manager.lock(target.path(), fast_options(), catcher.handler());
    file::write("someone-else", target.uid_file());

    REQUIRE(catcher.wait(5000));
    CHECK_EQ(catcher.code(), lock_errc_t::MISMATCH);
    CHECK_FALSE(lease.has_lock());
    CHECK(lease.compromised());
    CHECK_EQ(manager.size(), 0);

    // The new owner's lock is left alone.
    CHECK_EQ(file::read(target.uid_file()), std::string("someone-else"));
  }

  SUBCASE("A lock that was removed by someone else is reported as lost") {
    auto lease = manager.lock(target.path(), fast_options(), catcher.handler());
    file::remove_file(target.uid_file());
    file::remove_empty_dir(target.lock_dir());

    REQUIRE(catcher.wait(5000));
    CHECK_EQ(catcher.code(), lock_errc_t::NOT_FOUND);
    CHECK_FALSE(lease.has_lock());
    CHECK(lease.compromised());
    CHECK_EQ(manager.size(), 0);
  }

  SUBCASE("A lock that can not be renewed within the stale threshold times out") {
    auto fs = std::make_shared<failing_file_system_t>();
    auto opts = fast_options();
    opts.fs = fs;
    auto lease = manager.lock(target.path(), opts, catcher.handler());
    fs->fail_touch = true;

    REQUIRE(catcher.wait(6000));
    CHECK_EQ(catcher.code(), lock_errc_t::UPDATE_TIMEOUT);
    CHECK_FALSE(lease.has_lock());
    CHECK(lease.compromised());
    CHECK_THROWS_AS(lease.release(), lock_error_t);
    CHECK_EQ(manager.size(), 0);
    CHECK_FALSE(file::dir_exists(target.lock_dir()));
  }
}

TEST_CASE("Renewal that does not compromise the lock") {
  lock_target_t target;
  lock_manager_t manager;
  compromise_catcher_t catcher;
  auto fs = std::make_shared<failing_file_system_t>();

  SUBCASE("A lock recovers from a transient renewal failure") {
    lock_options_t opts;
    opts.stale_ms = 5000;
    opts.update_ms = 1000;
    opts.fs = fs;
    auto lease = manager.lock(target.path(), opts, catcher.handler());
    fs->touch_failures = 1;

    // The first renewal fails, the following ones (one second apart) succeed.
    time::sleep_millis(3500);
    CHECK_GE(fs->touch_calls.load(), 2);
    CHECK_FALSE(catcher.wait(0));
    CHECK(lease.has_lock());
    CHECK_FALSE(lease.compromised());
    CHECK_GE(file::get_modify_time(target.lock_dir()),
             time::millis_since_epoch() - opts.update_ms - 500);

    lease.release();
    CHECK_FALSE(file::dir_exists(target.lock_dir()));
  }

  SUBCASE("Releasing during a renewal neither renews nor compromises the lock") {
    auto opts = fast_options();
    opts.fs = fs;
    fs->touch_delay_ms = 500;
    auto lease = manager.lock(target.path(), opts, catcher.handler());

    // Wait for the first renewal to start, and release the lock while it is in flight.
    for (int i = 0; i < 300 && fs->touch_calls == 0; ++i) {
      time::sleep_millis(10);
    }
    REQUIRE_EQ(fs->touch_calls.load(), 1);
    lease.release();

    CHECK_FALSE(lease.has_lock());
    CHECK_FALSE(lease.compromised());
    CHECK_FALSE(file::dir_exists(target.lock_dir()));
    CHECK_EQ(manager.size(), 0);

    // No further renewals are scheduled.
    CHECK_FALSE(catcher.wait(2500));
    CHECK_EQ(fs->touch_calls.load(), 1);
  }
}

TEST_CASE("Failing to write the ownership token") {
  lock_target_t target;
  lock_manager_t manager;
  auto fs = std::make_shared<failing_file_system_t>();
  fs->fail_write = true;
  lock_options_t opts;
  opts.fs = fs;
  opts.retries = retry_policy_t(3);

  CHECK_EQ(lock_error_code(manager, target.path(), opts), lock_errc_t::IO_ERROR);
  CHECK_FALSE(file::dir_exists(target.lock_dir()));
  CHECK_EQ(manager.size(), 0);
}
