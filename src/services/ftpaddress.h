/**
 * @file ftpaddress.h
 * @brief Conversion between IPv4 endpoints and the PORT/PASV sextet.
 */

#ifndef FTPADDRESS_H
#define FTPADDRESS_H

#include <QHostAddress>
#include <QString>

/**
 * @brief Encodes and decodes the "h1,h2,h3,h4,p1,p2" host-port form.
 *
 * decode() is the exact inverse of encode() for any IPv4 address and port.
 */
class FtpAddressCodec
{
public:
    static constexpr int SextetSize = 6;                ///< Values in a host-port group
    static constexpr int PortMultiplier = 256;          ///< High port byte weight
    static constexpr int MaxOctet = 255;                ///< Largest value per field

    /**
     * @brief Formats an IPv4 address and port as a PORT argument.
     * @param address IPv4 address (an IPv4-mapped IPv6 address is accepted).
     * @param port TCP port.
     * @return "h1,h2,h3,h4,p1,p2", or an empty string if @p address is not IPv4.
     */
    [[nodiscard]] static QString encode(const QHostAddress &address, quint16 port);

    /**
     * @brief Extracts the host-port group from a PASV reply text.
     *
     * A parenthesised group is preferred; otherwise the last bare
     * comma-separated group of numbers in the text is used. The group must
     * hold exactly six integers in the range 0-255.
     *
     * @param text Reply text, e.g. "Entering Passive Mode (127,0,0,1,8,79)".
     * @param address Receives the decoded IPv4 address.
     * @param port Receives p1*256+p2.
     * @param errorMessage Optional. Receives the reason on failure.
     * @return True if a valid sextet was found.
     */
    static bool decode(const QString &text, QHostAddress &address, quint16 &port,
                       QString *errorMessage = nullptr);
};

#endif // FTPADDRESS_H
