#include "Pn532Transport.hpp"

#include <fcntl.h>
#include <linux/i2c-dev.h>
#include <poll.h>
#include <spdlog/spdlog.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

#include <array>
#include <boost/system/system_error.hpp>
#include <cerrno>
#include <cstring>
#include <thread>
#include <vector>

// Delay between status polls while the PN532 is busy (I2C)
static constexpr std::chrono::milliseconds I2C_POLL_DELAY{2};

namespace {

[[noreturn]] void throw_errno(const std::string& what) {
    throw boost::system::system_error(errno, boost::system::system_category(), what);
}

bool write_all(int fd, std::span<const uint8_t> bytes) {
    std::size_t done = 0;
    while (done < bytes.size()) {
        ssize_t n = ::write(fd, bytes.data() + done, bytes.size() - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        done += static_cast<std::size_t>(n);
    }
    return true;
}

int remaining_ms(Pn532Transport::Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Pn532Transport::Clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

}  // namespace

// =========================================================
//  I2C
// =========================================================

I2cTransport::I2cTransport(const std::string& device, uint8_t address) : device_(device) {
    fd_ = ::open(device.c_str(), O_RDWR);
    if (fd_ < 0) {
        throw_errno("Cannot open " + device);
    }
    if (::ioctl(fd_, I2C_SLAVE, address) < 0) {
        int saved = errno;
        ::close(fd_);
        fd_ = -1;
        errno = saved;
        throw_errno("Cannot address PN532 on " + device);
    }
    spdlog::debug("PN532 I2C link on {} (address 0x{:02X})", device, address);
}

I2cTransport::~I2cTransport() {
    if (fd_ >= 0) ::close(fd_);
}

bool I2cTransport::Write(std::span<const uint8_t> bytes) {
    if (!write_all(fd_, bytes)) {
        spdlog::debug("I2C write to {} failed: {}", device_, std::strerror(errno));
        return false;
    }
    return true;
}

std::optional<Pn532::Frame> I2cTransport::ReadFrame(Clock::time_point deadline) {
    std::array<uint8_t, Pn532::MAX_FRAME_SIZE + 1> buffer{};

    // The whole frame has to be fetched in one transfer, after the status byte turns ready
    do {
        ssize_t n = ::read(fd_, buffer.data(), buffer.size());
        if (n < 0 && errno != EINTR) {
            spdlog::debug("I2C read from {} failed: {}", device_, std::strerror(errno));
            return std::nullopt;
        }
        if (n > 1 && (buffer[0] & 0x01) != 0) {
            auto frame = Pn532::ParseFrame(std::span(buffer).subspan(1, static_cast<std::size_t>(n) - 1));
            if (frame.kind == Pn532::FrameKind::Incomplete) {
                frame.kind = Pn532::FrameKind::Invalid;
            }
            return frame;
        }
        std::this_thread::sleep_for(I2C_POLL_DELAY);
    } while (Clock::now() < deadline);

    return std::nullopt;
}

// =========================================================
//  UART (HSU)
// =========================================================

UartTransport::UartTransport(const std::string& device) : device_(device) {
    fd_ = ::open(device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) {
        throw_errno("Cannot open " + device);
    }

    termios tio{};
    if (::tcgetattr(fd_, &tio) != 0) {
        int saved = errno;
        ::close(fd_);
        fd_ = -1;
        errno = saved;
        throw_errno("Cannot configure " + device);
    }
    ::cfmakeraw(&tio);
    ::cfsetispeed(&tio, B115200);
    ::cfsetospeed(&tio, B115200);
    tio.c_cflag |= CLOCAL | CREAD;
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;
    if (::tcsetattr(fd_, TCSANOW, &tio) != 0) {
        int saved = errno;
        ::close(fd_);
        fd_ = -1;
        errno = saved;
        throw_errno("Cannot configure " + device);
    }
    ::tcflush(fd_, TCIOFLUSH);

    // Wake the PN532 out of low-power mode
    static constexpr std::array<uint8_t, 16> wakeup = {0x55, 0x55, 0x00, 0x00, 0x00, 0x00,
                                                       0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
                                                       0x00, 0x00, 0x00, 0x00};
    if (!write_all(fd_, wakeup)) {
        spdlog::warn("PN532 wake-up on {} failed: {}", device, std::strerror(errno));
    }

    spdlog::debug("PN532 UART link on {}", device);
}

UartTransport::~UartTransport() {
    if (fd_ >= 0) ::close(fd_);
}

bool UartTransport::Write(std::span<const uint8_t> bytes) {
    if (!write_all(fd_, bytes)) {
        spdlog::debug("UART write to {} failed: {}", device_, std::strerror(errno));
        return false;
    }
    return true;
}

std::optional<Pn532::Frame> UartTransport::ReadFrame(Clock::time_point deadline) {
    std::array<uint8_t, 64> chunk{};

    for (;;) {
        // A. Try to decode what we already have
        auto frame = Pn532::ParseFrame(pending_);
        if (frame.kind != Pn532::FrameKind::Incomplete) {
            pending_.erase(pending_.begin(),
                           pending_.begin() + static_cast<std::ptrdiff_t>(frame.consumed));
            return frame;
        }
        if (pending_.size() > 2 * Pn532::MAX_FRAME_SIZE) {
            pending_.clear();  // Line noise
        }

        // B. Wait for more bytes
        int timeout = remaining_ms(deadline);
        if (timeout == 0) {
            return std::nullopt;
        }

        pollfd pfd{fd_, POLLIN, 0};
        int ready = ::poll(&pfd, 1, timeout);
        if (ready < 0) {
            if (errno == EINTR) continue;
            spdlog::debug("UART poll on {} failed: {}", device_, std::strerror(errno));
            return std::nullopt;
        }
        if (ready == 0) {
            return std::nullopt;
        }

        ssize_t n = ::read(fd_, chunk.data(), chunk.size());
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            spdlog::debug("UART read from {} failed: {}", device_, std::strerror(errno));
            return std::nullopt;
        }
        pending_.insert(pending_.end(), chunk.begin(), chunk.begin() + n);
    }
}
