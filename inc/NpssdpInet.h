#ifndef NPSSDPINET_H
#define NPSSDPINET_H

/*!
 * \file
 *
 * \brief Provides a platform independent way to include TCP/IP types and
 * functions.
 */

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/param.h>
#include <arpa/inet.h>  /* for inet_pton() */
#include <net/if.h>
#include <netinet/in.h>
#include <unistd.h>

/*! Sockets are file descriptors here. */
typedef int SOCKET;

#define INVALID_SOCKET (-1)

/*! select() and friends return SOCKET_ERROR on failure. */
#define SOCKET_ERROR (-1)

#define NpssdpCloseSocket ::close

#endif /* NPSSDPINET_H */
