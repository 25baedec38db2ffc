/*
 * Copyright (C) 2024 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/un.h>

#include <memory>
#include <string>
#include <vector>

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>

/**
 * Classes to enable safe access to file descriptors.
 *
 * POSIX kernels recycle file descriptors, which causes hard to find problems
 * in code that doesn't manage file lifetimes properly. A SharedFD is a counted
 * reference to a FileInstance, which owns exactly one descriptor:
 *
 * o Files are auto-closed when the last reference goes out of scope.
 * o It is impossible to close the instance twice.
 * o SharedFDs are always initialized. By default the descriptor is set to a
 *   closed instance, so all method calls are safe.
 *
 * Errors on system calls that create new FileInstances, such as Open, are
 * reported with a new, closed FileInstance with the errno set.
 *
 * Only the thread that owns a descriptor should Close() it. Other threads
 * that need to unblock a reader use Shutdown() or an eventfd polled next to
 * the descriptor.
 */
namespace cvdr {

class FileInstance;
struct PollSharedFd;

class SharedFD {
 public:
  inline SharedFD();
  SharedFD(const std::shared_ptr<FileInstance>& in) : value_(in) {}
  SharedFD(SharedFD const&) = default;
  SharedFD(SharedFD&& other);
  SharedFD& operator=(SharedFD const&) = default;
  SharedFD& operator=(SharedFD&& other);

  static SharedFD Accept(const FileInstance& listener, struct sockaddr* addr,
                         socklen_t* addrlen);
  static SharedFD Accept(const FileInstance& listener);
  static SharedFD Dup(int unmanaged_fd);
  // All SharedFDs have the O_CLOEXEC flag after creation.
  static SharedFD Open(const std::string& pathname, int flags,
                       mode_t mode = 0);
  static bool Pipe(SharedFD* fd0, SharedFD* fd1);
  static SharedFD Event(int initval = 0, int flags = 0);
  static int Poll(std::vector<PollSharedFd>& fds, int timeout);
  static SharedFD Socket(int domain, int socket_type, int protocol);
  static SharedFD SocketLocalClient(const std::string& name, bool is_abstract,
                                    int in_type);
  static SharedFD SocketLocalClient(int port, int type);
  // Binds to the loopback interface. A port of 0 asks the kernel for an
  // ephemeral port, retrieve it with FileInstance::GetSockName.
  static SharedFD SocketLocalServer(int port, int type);
  // An existing file at `name` is never replaced, binding fails with
  // EADDRINUSE instead.
  static SharedFD SocketLocalServer(const std::string& name, bool is_abstract,
                                    int in_type, mode_t mode);

  bool operator==(const SharedFD& rhs) const { return value_ == rhs.value_; }
  bool operator!=(const SharedFD& rhs) const { return value_ != rhs.value_; }
  bool operator<(const SharedFD& rhs) const { return value_ < rhs.value_; }

  std::shared_ptr<FileInstance> operator->() const { return value_; }

  const FileInstance& operator*() const { return *value_; }

  FileInstance& operator*() { return *value_; }

 private:
  static SharedFD ErrorFD(int error);

  std::shared_ptr<FileInstance> value_;
};

/**
 * Tracks the lifetime of a file descriptor and provides methods to allow
 * callers to use the file without knowledge of the underlying descriptor
 * number.
 *
 * FileInstances have two states: Open and Closed. They may start in either
 * state. However, once a FileInstance enters the Closed state it cannot be
 * reopened.
 */
class FileInstance {
  // Give SharedFD access to the constructor.
  friend class SharedFD;

 public:
  virtual ~FileInstance() { Close(); }

  static std::shared_ptr<FileInstance> ClosedInstance();

  int Bind(const struct sockaddr* addr, socklen_t addrlen);
  int Connect(const struct sockaddr* addr, socklen_t addrlen);
  void Close();

  int UNMANAGED_Dup2(int newfd);
  int Fcntl(int command, int value);
  int Flock(int operation);

  int GetErrno() const { return errno_; }
  int GetSockName(struct sockaddr* addr, socklen_t* addrlen);

  bool IsOpen() const { return fd_ != -1; }

  int Listen(int backlog);
  ssize_t Read(void* buf, size_t count);
  ssize_t Recv(void* buf, size_t len, int flags);
  int EventfdRead(eventfd_t* value);
  ssize_t Send(const void* buf, size_t len, int flags);
  int Shutdown(int how);
  int SetSockOpt(int level, int optname, const void* optval, socklen_t optlen);
  std::string StrError() const;
  ssize_t Write(const void* buf, size_t count);
  int EventfdWrite(eventfd_t value);

 private:
  FileInstance(int fd, int in_errno);
  FileInstance* Accept(struct sockaddr* addr, socklen_t* addrlen) const;

  int fd_;
  int errno_;
};

struct PollSharedFd {
  SharedFD fd;
  short events;
  short revents;
};

SharedFD::SharedFD() : value_(FileInstance::ClosedInstance()) {}

}  // namespace cvdr
