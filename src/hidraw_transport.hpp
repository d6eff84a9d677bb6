#pragma once

#include <string>
#include <vector>

#include "transport.hpp"

namespace g6
{

struct HidNode
{
    std::string devnode;
    int interface_number = -1;
};

// hidraw nodes belonging to the G6, found through udev
std::vector<HidNode> enumerate_g6_nodes();

class HidrawTransport : public Transport
{
public:
    HidrawTransport(int fd, std::string devnode);
    virtual ~HidrawTransport();

    HidrawTransport(const HidrawTransport&) = delete;
    HidrawTransport& operator=(const HidrawTransport&) = delete;

    static Error open(const std::string& devnode, std::unique_ptr<Transport>& transport);

    Error write(const Frame& frame) override;
    Error read(Frame& frame, int timeout_ms) override;
    void close() override;

    const std::string& devnode() const { return m_devnode; }

private:
    int m_fd;
    std::string m_devnode;
};

class HidrawTransportFactory : public TransportFactory
{
public:
    explicit HidrawTransportFactory(int knob_interface = -1) : m_knobInterface(knob_interface) {}

    Error open_control(std::unique_ptr<Transport>& transport) override;
    Error open_knob(std::unique_ptr<Transport>& transport) override;

private:
    Error open_interface(int interface_number, std::unique_ptr<Transport>& transport);

    int m_knobInterface;
};

} // namespace g6
