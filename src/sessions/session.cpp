#include "tutorguard/sessions/session.hpp"

#include <openssl/rand.h>

#include <array>
#include <iomanip>
#include <sstream>

namespace tutorguard::sessions {

common::Result<std::string> generate_session_id() {
  std::array<unsigned char, 16> data{};
  if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    return common::Result<std::string>::failure("RAND_bytes failed to produce a session id");
  }

  data[6] = static_cast<unsigned char>((data[6] & 0x0FU) | 0x40U);
  data[8] = static_cast<unsigned char>((data[8] & 0x3FU) | 0x80U);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < data.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      stream << '-';
    }
    stream << std::setw(2) << static_cast<int>(data[i]);
  }
  return common::Result<std::string>::success(stream.str());
}

bool is_valid_session_id(const std::string &session_id) {
  if (session_id.size() != 36) {
    return false;
  }
  for (std::size_t i = 0; i < session_id.size(); ++i) {
    const char ch = session_id[i];
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (ch != '-') {
        return false;
      }
      continue;
    }
    if (!((ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f'))) {
      return false;
    }
  }
  return true;
}

} // namespace tutorguard::sessions
