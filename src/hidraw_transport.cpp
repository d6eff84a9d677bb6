#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <libudev.h>

#include "g6_logging.hpp"
#include "hidraw_transport.hpp"

namespace g6
{

namespace
{

constexpr int write_retries = 10;

bool is_removal_errno(int err)
{
    return err == ENODEV || err == EIO || err == ENXIO || err == EPIPE;
}

int sysattr_hex(udev_device* dev, const char* attr)
{
    const char* value = udev_device_get_sysattr_value(dev, attr);
    if (!value) {
        return -1;
    }
    return (int)std::strtol(value, nullptr, 16);
}

} // namespace

std::vector<HidNode> enumerate_g6_nodes()
{
    std::vector<HidNode> nodes;
    udev* u_dev = udev_new();
    if (!u_dev) {
        qCWarning(lcTransport) << "udev_new failed";
        return nodes;
    }
    udev_enumerate* enumerate = udev_enumerate_new(u_dev);
    if (!enumerate) {
        qCWarning(lcTransport) << "udev_enumerate_new failed";
        udev_unref(u_dev);
        return nodes;
    }
    udev_enumerate_add_match_subsystem(enumerate, "hidraw");
    udev_enumerate_scan_devices(enumerate);

    udev_list_entry* entry;
    udev_list_entry_foreach(entry, udev_enumerate_get_list_entry(enumerate)) {
        const char* syspath = udev_list_entry_get_name(entry);
        udev_device* dev = udev_device_new_from_syspath(u_dev, syspath);
        if (!dev) {
            continue;
        }
        // Parents are owned by the child device, no unref
        udev_device* usb_dev = udev_device_get_parent_with_subsystem_devtype(dev, "usb", "usb_device");
        udev_device* usb_intf = udev_device_get_parent_with_subsystem_devtype(dev, "usb", "usb_interface");
        const char* devnode = udev_device_get_devnode(dev);
        if (usb_dev && usb_intf && devnode
            && sysattr_hex(usb_dev, "idVendor") == proto::vendor_id
            && sysattr_hex(usb_dev, "idProduct") == proto::product_id) {
            nodes.push_back({devnode, sysattr_hex(usb_intf, "bInterfaceNumber")});
            qCDebug(lcTransport) << "Found G6 node" << devnode << "interface" << nodes.back().interface_number;
        }
        udev_device_unref(dev);
    }
    udev_enumerate_unref(enumerate);
    udev_unref(u_dev);
    return nodes;
}

HidrawTransport::HidrawTransport(int fd, std::string devnode)
    : m_fd(fd), m_devnode(std::move(devnode))
{
}

HidrawTransport::~HidrawTransport()
{
    close();
}

Error HidrawTransport::open(const std::string& devnode, std::unique_ptr<Transport>& transport)
{
    int fd = ::open(devnode.c_str(), O_RDWR | O_NONBLOCK);
    if (fd < 0) {
        int err = errno;
        qCWarning(lcTransport) << "Could not open" << devnode.c_str() << ":" << std::strerror(err);
        return err == ENOENT || err == ENODEV ? Error::NotFound : Error::IoError;
    }
    transport = std::make_unique<HidrawTransport>(fd, devnode);
    qCInfo(lcTransport) << "Opened" << devnode.c_str();
    return Error::Ok;
}

Error HidrawTransport::write(const Frame& frame)
{
    if (m_fd < 0) {
        return Error::DeviceGone;
    }
    Report report = make_report(frame);
    size_t written = 0;
    int retries = 0;
    while (written < report.size()) {
        ssize_t res = ::write(m_fd, report.data() + written, report.size() - written);
        if (res < 0) {
            int err = errno;
            if ((err == EINTR || err == EAGAIN) && ++retries < write_retries) {
                usleep(1000);
                continue;
            }
            if (is_removal_errno(err)) {
                qCWarning(lcTransport) << "Device removed during write:" << std::strerror(err);
                return Error::DeviceGone;
            }
            qCWarning(lcTransport) << "Write error:" << std::strerror(err);
            return Error::IoError;
        }
        written += (size_t)res;
    }
    return Error::Ok;
}

Error HidrawTransport::read(Frame& frame, int timeout_ms)
{
    if (m_fd < 0) {
        return Error::DeviceGone;
    }
    pollfd pfd = {m_fd, POLLIN, 0};
    int res = ::poll(&pfd, 1, timeout_ms);
    if (res < 0) {
        int err = errno;
        if (err == EINTR) {
            return Error::Timeout;
        }
        qCWarning(lcTransport) << "Poll error:" << std::strerror(err);
        return Error::IoError;
    }
    if (res == 0) {
        return Error::Timeout;
    }
    if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) {
        return Error::DeviceGone;
    }

    frame.fill(0);
    ssize_t n = ::read(m_fd, frame.data(), frame.size());
    if (n < 0) {
        int err = errno;
        if (err == EAGAIN || err == EINTR) {
            return Error::Timeout;
        }
        if (is_removal_errno(err)) {
            return Error::DeviceGone;
        }
        qCWarning(lcTransport) << "Read error:" << std::strerror(err);
        return Error::IoError;
    }
    if (n == 0) {
        return Error::DeviceGone;
    }
    return Error::Ok;
}

void HidrawTransport::close()
{
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
        qCDebug(lcTransport) << "Closed" << m_devnode.c_str();
    }
}

Error HidrawTransportFactory::open_interface(int interface_number, std::unique_ptr<Transport>& transport)
{
    for (const auto& node : enumerate_g6_nodes()) {
        if (node.interface_number == interface_number) {
            return HidrawTransport::open(node.devnode, transport);
        }
    }
    return Error::NotFound;
}

Error HidrawTransportFactory::open_control(std::unique_ptr<Transport>& transport)
{
    return open_interface(proto::control_interface, transport);
}

Error HidrawTransportFactory::open_knob(std::unique_ptr<Transport>& transport)
{
    if (m_knobInterface < 0) {
        transport.reset();
        return Error::Ok;
    }
    Error err = open_interface(m_knobInterface, transport);
    if (err == Error::NotFound) {
        qCInfo(lcTransport) << "No volume knob interface" << m_knobInterface;
        transport.reset();
        return Error::Ok;
    }
    return err;
}

} // namespace g6
