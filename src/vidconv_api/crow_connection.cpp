#include "vidconv_api/crow_connection.hpp"

namespace vidconv_api {

CrowConnection::CrowConnection(crow::websocket::connection &connection)
    : connection_(&connection), remote_address_(connection.get_remote_ip()) {}

void CrowConnection::send_text(const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (connection_ == nullptr) {
    return;
  }
  connection_->send_text(message);
}

bool CrowConnection::is_open() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connection_ != nullptr;
}

void CrowConnection::mark_closed() {
  std::lock_guard<std::mutex> lock(mutex_);
  connection_ = nullptr;
}

void CrowConnection::close(const std::string &reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (connection_ == nullptr) {
    return;
  }
  connection_->close(reason);
}

}  // namespace vidconv_api
