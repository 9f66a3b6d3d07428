// MIT License
#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace mycobot_driver {

  // Half-duplex byte channel used by MyCobotOperator.
  class IConnection {
  public:
    virtual ~IConnection() = default;
    // Write all bytes. Returns false and sets err on a transport fault.
    virtual bool write(const std::vector<uint8_t>& data, std::string& err) = 0;
    // Write all bytes, then collect whatever reply arrives. An empty reply after
    // a read timeout is not a fault.
    virtual bool writeAndRead(const std::vector<uint8_t>& data, std::vector<uint8_t>& reply,
                              std::string& err) = 0;
  };

  class SerialTransport : public IConnection {
  public:
    SerialTransport(const std::string& device, int baud_rate, double read_timeout_sec = 0.1);
    ~SerialTransport() override;
    SerialTransport(const SerialTransport&) = delete;
    SerialTransport& operator=(const SerialTransport&) = delete;

    bool ok() const { return fd_ >= 0; }
    const std::string& openError() const { return open_err_; }
    bool write(const std::vector<uint8_t>& data, std::string& err) override;
    bool writeAndRead(const std::vector<uint8_t>& data, std::vector<uint8_t>& reply,
                      std::string& err) override;
  private:
    int fd_ = -1;
    std::string device_;
    int baud_ = 0;
    double read_timeout_sec_ = 0.1;
    std::string open_err_;
    bool openPort(std::string& err);
    // Drop unread input so a late reply to an earlier request is not taken
    // as the answer to the next one.
    void discardInput();
    bool writeBytes(const uint8_t* data, size_t len, std::string& err);
    // Returns 1 on a byte, 0 on timeout, -1 on error (err set).
    int readByte(uint8_t& out, int timeout_ms, std::string& err);
  };

} // namespace mycobot_driver
