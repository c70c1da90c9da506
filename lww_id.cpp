// lww_id.cpp
#include "lww_id.hpp"

#include <uuid/uuid.h> // libuuid

LwwWriterId generate_writer_id() {
  LwwWriterId id = 0;
  while (id == 0) {
    uuid_t uuid;
    uuid_generate_random(uuid);
    for (int i = 0; i < 8; ++i) {
      id = (id << 8) | static_cast<LwwWriterId>(uuid[i]);
    }
  }
  return id;
}

std::string generate_row_id() {
  uuid_t uuid;
  uuid_generate_random(uuid);

  char uuid_str[37];
  uuid_unparse_lower(uuid, uuid_str);

  return std::string(uuid_str);
}
