#include "crypto/secure_random.h"

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#if defined(__linux__)
  #include <sys/syscall.h>
#endif

namespace mpay {

static bool urandom_read(uint8_t* out, size_t len){
    int fd = ::open("/dev/urandom", O_RDONLY | O_CLOEXEC);
    if(fd < 0) return false;
    size_t off = 0;
    while(off < len){
        ssize_t r = ::read(fd, out + off, len - off);
        if(r <= 0){
            if(r < 0 && errno == EINTR) continue;
            ::close(fd);
            return false;
        }
        off += static_cast<size_t>(r);
    }
    ::close(fd);
    return true;
}

bool secure_random(uint8_t* out, size_t len, std::string* err){
#if defined(__linux__) && defined(SYS_getrandom)
    size_t off = 0;
    while(off < len){
        long r = syscall(SYS_getrandom, out + off, len - off, 0);
        if(r < 0){
            if(errno == EINTR) continue;
            break;
        }
        off += static_cast<size_t>(r);
    }
    if(off == len) return true;
#endif
    if(urandom_read(out, len)) return true;
    if(err) *err = "getrandom()/urandom failed";
    return false;
}

}
