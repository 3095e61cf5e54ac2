#ifndef MORCEAU_TYPES_HH
# define MORCEAU_TYPES_HH

# include <stdint.h>

namespace morceau
{
  typedef uint64_t FileSize;
  typedef uint64_t PartIndex;
  typedef uint64_t PartCount;

  /// Size of a part unless configured otherwise.
  static FileSize const default_chunk_size = 4 * 1024 * 1024;
  /// Upper bound of the streaming buffers unless configured otherwise.
  static FileSize const default_buffer_capacity = 4 * 1024 * 1024;
}

#endif
