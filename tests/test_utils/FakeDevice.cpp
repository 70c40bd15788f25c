#include "FakeDevice.hpp"
#include "device-inspector/errors.hpp"

namespace devinspect {
namespace test {

ScriptedStream::ScriptedStream(std::vector<std::string> chunks)
    : chunks_(chunks.begin(), chunks.end()) {}

void ScriptedStream::write(const std::string &data) {
  if (!open_)
    throw StreamClosedError("scripted stream closed");
  writes_.push_back(data);
}

std::string ScriptedStream::read_some(std::chrono::milliseconds) {
  if (!open_)
    throw StreamClosedError("scripted stream closed");
  if (chunks_.empty()) {
    if (close_when_exhausted_)
      throw StreamClosedError("peer closed the connection");
    return "";
  }
  std::string chunk = chunks_.front();
  chunks_.pop_front();
  return chunk;
}

FakeDevice::FakeDevice(std::string prompt) : prompt_(std::move(prompt)) {}

void FakeDevice::set_response(const std::string &command,
                              const std::string &output) {
  responses_[command] = output;
}

void FakeDevice::set_failure(const std::string &command) {
  failures_.insert(command);
}

void FakeDevice::set_enable(const std::string &secret,
                            const std::string &enabled_prompt) {
  enable_configured_ = true;
  enable_secret_ = secret;
  enabled_prompt_ = enabled_prompt;
}

void FakeDevice::set_login(const std::string &username,
                           const std::string &password) {
  login_username_ = username;
  login_password_ = password;
  stage_ = Stage::USERNAME;
  output_ = "\r\nUser Access Verification\r\n\r\nUsername: ";
}

void FakeDevice::write(const std::string &data) {
  if (dead_ || !open_)
    throw StreamClosedError("connection reset by peer");
  input_ += data;
  size_t pos;
  while ((pos = input_.find('\n')) != std::string::npos) {
    std::string line = input_.substr(0, pos);
    input_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    lines_.push_back(line);
    handle_line(line);
  }
}

std::string FakeDevice::read_some(std::chrono::milliseconds) {
  if (dead_ || !open_)
    throw StreamClosedError("connection reset by peer");
  std::string out;
  out.swap(output_);
  return out;
}

void FakeDevice::handle_line(const std::string &line) {
  switch (stage_) {
  case Stage::USERNAME:
    stage_ = Stage::PASSWORD;
    output_ += "\r\nPassword: ";
    return;
  case Stage::PASSWORD:
    if (lines_.size() >= 2 && lines_[lines_.size() - 2] == login_username_ &&
        line == login_password_) {
      stage_ = Stage::SHELL;
      output_ += "\r\n" + prompt_;
    } else {
      stage_ = Stage::USERNAME;
      output_ += "\r\n% Login invalid\r\n\r\nUsername: ";
    }
    return;
  case Stage::ENABLE_PASSWORD:
    if (line == enable_secret_) {
      stage_ = Stage::SHELL;
      enable_failures_ = 0;
      prompt_ = enabled_prompt_;
      output_ += "\r\n" + prompt_;
    } else if (++enable_failures_ < enable_tries_) {
      output_ += "\r\nPassword: ";
    } else {
      stage_ = Stage::SHELL;
      enable_failures_ = 0;
      output_ += "\r\n% Bad secrets\r\n\r\n" + prompt_;
    }
    return;
  case Stage::SHELL:
    handle_shell_line(line);
    return;
  }
}

void FakeDevice::handle_shell_line(const std::string &line) {
  if (line.empty()) {
    output_ += "\r\n" + prompt_;
    return;
  }
  if (failures_.count(line)) {
    dead_ = true;
    return;
  }
  if (line == "enable" && enable_configured_) {
    if (enable_secret_.empty()) {
      prompt_ = enabled_prompt_;
      output_ += line + "\n" + prompt_;
    } else {
      stage_ = Stage::ENABLE_PASSWORD;
      output_ += line + "\nPassword: ";
    }
    return;
  }

  auto it = responses_.find(line);
  if (it != responses_.end()) {
    output_ += line + "\n" + it->second + "\n" + prompt_;
  } else {
    output_ += line + "\n% Unknown command\n" + prompt_;
  }
}

FakeTransportFactory::FakeTransportFactory(StreamBuilder builder,
                                           const Clock &clock)
    : builder_(std::move(builder)), clock_(clock) {}

std::unique_ptr<transport::ByteStream>
FakeTransportFactory::open_telnet(const DeviceDescriptor &descriptor) {
  {
    std::lock_guard lock(mutex_);
    ++telnet_opens_;
  }
  return open(descriptor);
}

std::unique_ptr<transport::ByteStream>
FakeTransportFactory::open_ssh_shell(const DeviceDescriptor &descriptor) {
  {
    std::lock_guard lock(mutex_);
    ++ssh_opens_;
  }
  return open(descriptor);
}

std::unique_ptr<transport::ByteStream>
FakeTransportFactory::open(const DeviceDescriptor &descriptor) {
  {
    std::lock_guard lock(mutex_);
    attempts_[descriptor.host].push_back(clock_.now());
  }
  return builder_(descriptor);
}

int FakeTransportFactory::attempts(const std::string &host) const {
  std::lock_guard lock(mutex_);
  auto it = attempts_.find(host);
  return it == attempts_.end() ? 0 : static_cast<int>(it->second.size());
}

std::vector<Clock::time_point>
FakeTransportFactory::attempt_times(const std::string &host) const {
  std::lock_guard lock(mutex_);
  auto it = attempts_.find(host);
  return it == attempts_.end() ? std::vector<Clock::time_point>{}
                               : it->second;
}

int FakeTransportFactory::telnet_opens() const {
  std::lock_guard lock(mutex_);
  return telnet_opens_;
}

int FakeTransportFactory::ssh_opens() const {
  std::lock_guard lock(mutex_);
  return ssh_opens_;
}

} // namespace test
} // namespace devinspect
