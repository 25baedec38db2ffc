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
#include "cvdr/common/libs/fs/shared_fd.h"

#include <netinet/in.h>
#include <poll.h>
#include <sys/file.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <cstddef>
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <vector>

#include <android-base/logging.h>
#include <android-base/macros.h>

namespace cvdr {

namespace {

bool MakeAddress(const std::string& name, bool abstract,
                 struct sockaddr_un* dest, socklen_t* len) {
  memset(dest, 0, sizeof(*dest));
  dest->sun_family = AF_UNIX;
  // sun_path is NOT expected to be nul-terminated.
  // See man 7 unix.
  size_t namelen = name.size();
  if (abstract) {
    if (namelen > sizeof(dest->sun_path) - 1) {
      return false;
    }
    dest->sun_path[0] = 0;
    memcpy(dest->sun_path + 1, name.c_str(), namelen);
    *len = namelen + offsetof(struct sockaddr_un, sun_path) + 1;
  } else {
    if (namelen > sizeof(dest->sun_path) - 1) {
      return false;
    }
    memcpy(dest->sun_path, name.c_str(), namelen);
    *len = namelen + offsetof(struct sockaddr_un, sun_path) + 1;
  }
  return true;
}

}  // namespace

SharedFD::SharedFD(SharedFD&& other) : value_(std::move(other.value_)) {
  other.value_ = FileInstance::ClosedInstance();
}

SharedFD& SharedFD::operator=(SharedFD&& other) {
  value_ = std::move(other.value_);
  other.value_ = FileInstance::ClosedInstance();
  return *this;
}

FileInstance::FileInstance(int fd, int in_errno) : fd_(fd), errno_(in_errno) {
  // Ensure every file descriptor managed by a FileInstance has the CLOEXEC
  // flag
  if (fd_ != -1) {
    int flags = fcntl(fd, F_GETFD);
    if (flags == -1) {
      errno_ = errno;
    } else if (fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == -1) {
      errno_ = errno;
    }
  }
}

std::shared_ptr<FileInstance> FileInstance::ClosedInstance() {
  return std::shared_ptr<FileInstance>(new FileInstance(-1, EBADF));
}

void FileInstance::Close() {
  if (fd_ == -1) {
    errno_ = EBADF;
  } else if (close(fd_) == -1) {
    errno_ = errno;
  }
  fd_ = -1;
}

int FileInstance::Bind(const struct sockaddr* addr, socklen_t addrlen) {
  errno = 0;
  int rval = bind(fd_, addr, addrlen);
  errno_ = errno;
  return rval;
}

int FileInstance::Connect(const struct sockaddr* addr, socklen_t addrlen) {
  errno = 0;
  int rval = TEMP_FAILURE_RETRY(connect(fd_, addr, addrlen));
  errno_ = errno;
  return rval;
}

int FileInstance::UNMANAGED_Dup2(int newfd) {
  errno = 0;
  int rval = TEMP_FAILURE_RETRY(dup2(fd_, newfd));
  errno_ = errno;
  return rval;
}

int FileInstance::Fcntl(int command, int value) {
  errno = 0;
  int rval = TEMP_FAILURE_RETRY(fcntl(fd_, command, value));
  errno_ = errno;
  return rval;
}

int FileInstance::Flock(int operation) {
  errno = 0;
  int rval = TEMP_FAILURE_RETRY(flock(fd_, operation));
  errno_ = errno;
  return rval;
}

int FileInstance::GetSockName(struct sockaddr* addr, socklen_t* addrlen) {
  errno = 0;
  int rval = TEMP_FAILURE_RETRY(getsockname(fd_, addr, addrlen));
  errno_ = errno;
  return rval;
}

int FileInstance::Listen(int backlog) {
  errno = 0;
  int rval = listen(fd_, backlog);
  errno_ = errno;
  return rval;
}

ssize_t FileInstance::Read(void* buf, size_t count) {
  errno = 0;
  ssize_t rval = TEMP_FAILURE_RETRY(read(fd_, buf, count));
  errno_ = errno;
  return rval;
}

ssize_t FileInstance::Recv(void* buf, size_t len, int flags) {
  errno = 0;
  ssize_t rval = TEMP_FAILURE_RETRY(recv(fd_, buf, len, flags));
  errno_ = errno;
  return rval;
}

int FileInstance::EventfdRead(eventfd_t* value) {
  errno = 0;
  int rval = eventfd_read(fd_, value);
  errno_ = errno;
  return rval;
}

ssize_t FileInstance::Send(const void* buf, size_t len, int flags) {
  errno = 0;
  ssize_t rval = TEMP_FAILURE_RETRY(send(fd_, buf, len, flags));
  errno_ = errno;
  return rval;
}

int FileInstance::Shutdown(int how) {
  errno = 0;
  int rval = shutdown(fd_, how);
  errno_ = errno;
  return rval;
}

int FileInstance::SetSockOpt(int level, int optname, const void* optval,
                             socklen_t optlen) {
  errno = 0;
  int rval = setsockopt(fd_, level, optname, optval, optlen);
  errno_ = errno;
  return rval;
}

std::string FileInstance::StrError() const {
  errno = 0;
  return std::string(strerror(errno_));
}

ssize_t FileInstance::Write(const void* buf, size_t count) {
  if (count == 0) {
    return 0;
  }
  errno = 0;
  // MSG_NOSIGNAL is not available to write(2); a peer that went away must
  // produce EPIPE instead of killing the process, so use send on sockets.
  ssize_t rval = TEMP_FAILURE_RETRY(send(fd_, buf, count, MSG_NOSIGNAL));
  if (rval == -1 && errno == ENOTSOCK) {
    errno = 0;
    rval = TEMP_FAILURE_RETRY(write(fd_, buf, count));
  }
  errno_ = errno;
  return rval;
}

int FileInstance::EventfdWrite(eventfd_t value) {
  errno = 0;
  int rval = eventfd_write(fd_, value);
  errno_ = errno;
  return rval;
}

FileInstance* FileInstance::Accept(struct sockaddr* addr,
                                   socklen_t* addrlen) const {
  int fd = TEMP_FAILURE_RETRY(accept(fd_, addr, addrlen));
  if (fd == -1) {
    return new FileInstance(fd, errno);
  } else {
    return new FileInstance(fd, 0);
  }
}

SharedFD SharedFD::Accept(const FileInstance& listener, struct sockaddr* addr,
                          socklen_t* addrlen) {
  return SharedFD(
      std::shared_ptr<FileInstance>(listener.Accept(addr, addrlen)));
}

SharedFD SharedFD::Accept(const FileInstance& listener) {
  return SharedFD::Accept(listener, NULL, NULL);
}

SharedFD SharedFD::Dup(int unmanaged_fd) {
  int fd = fcntl(unmanaged_fd, F_DUPFD_CLOEXEC, 3);
  int error_num = errno;
  return SharedFD(
      std::shared_ptr<FileInstance>(new FileInstance(fd, error_num)));
}

SharedFD SharedFD::Open(const std::string& path, int flags, mode_t mode) {
  int fd = TEMP_FAILURE_RETRY(open(path.c_str(), flags, mode));
  if (fd == -1) {
    return SharedFD(std::shared_ptr<FileInstance>(new FileInstance(fd, errno)));
  } else {
    return SharedFD(std::shared_ptr<FileInstance>(new FileInstance(fd, 0)));
  }
}

bool SharedFD::Pipe(SharedFD* fd0, SharedFD* fd1) {
  int fds[2];
  int rval = pipe2(fds, O_CLOEXEC);
  if (rval != -1) {
    (*fd0) = std::shared_ptr<FileInstance>(new FileInstance(fds[0], errno));
    (*fd1) = std::shared_ptr<FileInstance>(new FileInstance(fds[1], errno));
    return true;
  }
  return false;
}

SharedFD SharedFD::Event(int initval, int flags) {
  int fd = eventfd(initval, flags);
  return std::shared_ptr<FileInstance>(new FileInstance(fd, errno));
}

int SharedFD::Poll(std::vector<PollSharedFd>& fds, int timeout) {
  std::vector<pollfd> native_pollfds(fds.size());
  for (size_t i = 0; i < fds.size(); i++) {
    native_pollfds[i].fd = fds[i].fd->fd_;
    native_pollfds[i].events = fds[i].events;
    native_pollfds[i].revents = 0;
  }
  int ret = TEMP_FAILURE_RETRY(
      poll(native_pollfds.data(), native_pollfds.size(), timeout));
  for (size_t i = 0; i < fds.size(); i++) {
    fds[i].revents = native_pollfds[i].revents;
  }
  return ret;
}

SharedFD SharedFD::Socket(int domain, int socket_type, int protocol) {
  int fd = TEMP_FAILURE_RETRY(socket(domain, socket_type, protocol));
  if (fd == -1) {
    return SharedFD(std::shared_ptr<FileInstance>(new FileInstance(fd, errno)));
  } else {
    return SharedFD(std::shared_ptr<FileInstance>(new FileInstance(fd, 0)));
  }
}

SharedFD SharedFD::ErrorFD(int error) {
  return SharedFD(std::shared_ptr<FileInstance>(new FileInstance(-1, error)));
}

SharedFD SharedFD::SocketLocalClient(const std::string& name, bool abstract,
                                     int in_type) {
  struct sockaddr_un addr;
  socklen_t addrlen;
  if (!MakeAddress(name, abstract, &addr, &addrlen)) {
    return SharedFD::ErrorFD(ENAMETOOLONG);
  }
  SharedFD rval = SharedFD::Socket(PF_UNIX, in_type, 0);
  if (!rval->IsOpen()) {
    return rval;
  }
  if (rval->Connect(reinterpret_cast<sockaddr*>(&addr), addrlen) == -1) {
    return SharedFD::ErrorFD(rval->GetErrno());
  }
  return rval;
}

SharedFD SharedFD::SocketLocalClient(int port, int type) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  SharedFD rval = SharedFD::Socket(AF_INET, type, 0);
  if (!rval->IsOpen()) {
    return rval;
  }
  if (rval->Connect(reinterpret_cast<const sockaddr*>(&addr), sizeof addr) <
      0) {
    return SharedFD::ErrorFD(rval->GetErrno());
  }
  return rval;
}

SharedFD SharedFD::SocketLocalServer(int port, int type) {
  struct sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  SharedFD rval = SharedFD::Socket(AF_INET, type, 0);
  if (!rval->IsOpen()) {
    return rval;
  }
  int n = 1;
  if (rval->SetSockOpt(SOL_SOCKET, SO_REUSEADDR, &n, sizeof(n)) == -1) {
    LOG(ERROR) << "SetSockOpt failed " << rval->StrError();
    return SharedFD::ErrorFD(rval->GetErrno());
  }
  if (rval->Bind(reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    LOG(ERROR) << "Bind failed " << rval->StrError();
    return SharedFD::ErrorFD(rval->GetErrno());
  }
  if (type == SOCK_STREAM) {
    if (rval->Listen(4) < 0) {
      LOG(ERROR) << "Listen failed " << rval->StrError();
      return SharedFD::ErrorFD(rval->GetErrno());
    }
  }
  return rval;
}

SharedFD SharedFD::SocketLocalServer(const std::string& name, bool abstract,
                                     int in_type, mode_t mode) {
  struct sockaddr_un addr;
  socklen_t addrlen;
  if (!MakeAddress(name, abstract, &addr, &addrlen)) {
    LOG(ERROR) << "Socket name too long: " << name;
    return SharedFD::ErrorFD(ENAMETOOLONG);
  }
  SharedFD rval = SharedFD::Socket(PF_UNIX, in_type, 0);
  if (!rval->IsOpen()) {
    return rval;
  }
  if (rval->Bind(reinterpret_cast<sockaddr*>(&addr), addrlen) == -1) {
    LOG(DEBUG) << "Bind failed; name=" << name << ": " << rval->StrError();
    return SharedFD::ErrorFD(rval->GetErrno());
  }

  /* Only the bottom bits are really the socket type; there are flags too. */
  constexpr int SOCK_TYPE_MASK = 0xf;

  // Connection oriented sockets: start listening.
  int type = in_type & SOCK_TYPE_MASK;
  if (type == SOCK_STREAM || type == SOCK_SEQPACKET) {
    if (rval->Listen(4) == -1) {
      LOG(ERROR) << "Listen failed: " << rval->StrError();
      return SharedFD::ErrorFD(rval->GetErrno());
    }
  }

  if (!abstract) {
    if (TEMP_FAILURE_RETRY(chmod(name.c_str(), mode)) == -1) {
      LOG(ERROR) << "chmod failed: " << strerror(errno);
      // However, continue since we do have a listening socket
    }
  }
  return rval;
}

}  // namespace cvdr
