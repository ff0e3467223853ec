#ifndef NPSSDP_H
#define NPSSDP_H

/*******************************************************************************
 *
 * Copyright (c) 2000-2003 Intel Corporation 
 * Copyright (C) 2011-2012 France Telecom All rights reserved.
 * Copyright (C) 2020 J.F. Dockes <jf@dockes.org>
 * All rights reserved. 
 *
 * Redistribution and use in source and binary forms, with or without 
 * modification, are permitted provided that the following conditions are met: 
 *
 * * Redistributions of source code must retain the above copyright notice, 
 * this list of conditions and the following disclaimer. 
 * * Redistributions in binary form must reproduce the above copyright notice, 
 * this list of conditions and the following disclaimer in the documentation 
 * and/or other materials provided with the distribution. 
 * * Neither name of Intel Corporation nor the names of its contributors 
 * may be used to endorse or promote products derived from this software 
 * without specific prior written permission.
 * 
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS 
 * "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT 
 * LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR 
 * A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL INTEL OR 
 * CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, 
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, 
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR 
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY 
 * OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS 
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 ******************************************************************************/

#include <string>

#include "NpssdpGlobal.h"
#include "NpssdpInet.h"

#define NPSSDP_INFINITE		-1

/*!
 * \name Error codes
 *
 * The functions in the library return these codes to describe problems
 * encountered during execution. Refer to the documentation for each
 * function for what an error code means in that context.
 *
 * @{
 */

/*!
 * \brief The operation completed successfully.
 */
#define NPSSDP_E_SUCCESS		0

/*!
 * \brief One or more of the parameters passed to the function is not valid.
 */
#define NPSSDP_E_INVALID_PARAM		-101

/*!
 * \brief Not enough resources are currently available to complete the
 * operation.
 */
#define NPSSDP_E_OUTOF_MEMORY		-104

/*!
 * \brief The library has already been initialized.
 *
 * Any additional initialization attempt returns this error with no other
 * ill effects.
 */
#define NPSSDP_E_INIT			-105

/*!
 * \brief An URL was invalid.
 */
#define NPSSDP_E_INVALID_URL		-108

/*!
 * \brief A response received from the network was malformed.
 */
#define NPSSDP_E_BAD_RESPONSE		-113

/*!
 * \brief NpssdpFinish() was called without a previous initialization.
 */
#define NPSSDP_E_FINISH			-116

/*!
 * \brief Initialization failed. Typically a thread pool or the logging
 * could not be set up.
 */
#define NPSSDP_E_INIT_FAILED		-117

/*!
 * \brief No usable network interface was found, or the one requested by
 * name does not exist or has no IPv4 address.
 */
#define NPSSDP_E_INVALID_INTERFACE	-121

/*!
 * \brief A network error occurred.
 */
#define NPSSDP_E_NETWORK_ERROR		-200

/*!
 * \brief An error happened while writing to a socket.
 */
#define NPSSDP_E_SOCKET_WRITE		-201

/*!
 * \brief The library could not bind a socket to an address. Most likely
 * the port is in use without SO_REUSEADDR, or permission was denied.
 */
#define NPSSDP_E_SOCKET_BIND		-203

/*!
 * \brief No more sockets could be created.
 */
#define NPSSDP_E_OUTOF_SOCKET		-205

/*!
 * \brief A generic socket error, typically a failed setsockopt().
 */
#define NPSSDP_E_SOCKET_ERROR		-208

/*!
 * \brief Generic error code for internal conditions not covered by other
 * error codes.
 */
#define NPSSDP_E_INTERNAL_ERROR		-911

/* @} ErrorCodes */

/*! Return a static string describing an NPSSDP_E_XXX error code. */
EXPORT_SPEC const char *NpssdpGetErrorMessage(int rc);

/*!
 * \name Logging
 *
 * @{
 */

/*! Log levels, in order of increasing verbosity. */
enum Npssdp_LogLevel {
    NPSSDP_CRITICAL,
    NPSSDP_ERROR,
    NPSSDP_WARNING,
    NPSSDP_INFO,
    NPSSDP_DEBUG,
    NPSSDP_ALL
};

/*! Level used when nothing was set. */
#define NPSSDP_DEFAULT_LOG_LEVEL NPSSDP_WARNING

/*! Log categories. SSDP is the discovery category. */
enum Dbg_Module {
    SSDP,
    API,
    TPOOL,
    NETIF
};

/*!
 * \brief Set the log file name. Output goes to stderr if this is not
 * called, or is called with an empty name.
 *
 * Takes effect at the next NpssdpInitLog() call, which NpssdpInit() does.
 */
EXPORT_SPEC void NpssdpSetLogFileName(const char *fileName);

/*! Set the maximum level of the messages which will be written. */
EXPORT_SPEC void NpssdpSetLogLevel(Npssdp_LogLevel level);

/*!
 * \brief Open the log output.
 *
 * Nothing is logged unless NpssdpSetLogFileName() or NpssdpSetLogLevel()
 * was called before, or NPSSDP_FORCELOG is set in the environment. Can be
 * called again to reopen (rotate) the file.
 *
 * \return NPSSDP_E_SUCCESS.
 */
EXPORT_SPEC int NpssdpInitLog();

/*! Close the log file. Further messages are dropped. */
EXPORT_SPEC void NpssdpCloseLog();

/*!
 * \brief Write a message to the log if the level allows it.
 *
 * Use like:
 *   NpssdpPrintf(NPSSDP_INFO, SSDP, __FILE__, __LINE__, "fmt %d\n", val);
 */
EXPORT_SPEC void NpssdpPrintf(
    Npssdp_LogLevel DLevel, Dbg_Module Module,
    const char *DbgFileName, int DbgLineNo, const char *FmtStr, ...)
#if defined(__GNUC__)
    __attribute__((format (printf, 5, 6)))
#endif
    ;

/* @} Logging */

/*!
 * \name Configuration
 *
 * @{
 */

/*! Parameters for a discovery coordinator and its transport. */
struct SsdpDiscoveryOptions {
    /*! Interface to send the M-SEARCH multicasts on. If empty, the first
     *  interface which is up, multicast-capable, non-loopback and has an
     *  IPv4 address is used. */
    std::string ifname;
    /*! Local UDP port. 0 for an ephemeral port. Using 1900 also joins the
     *  multicast group, with SO_REUSEADDR set. */
    unsigned short port{0};
    /*! Multicast TTL for the outgoing searches. */
    int ttl{2};
    /*! Set IP_MULTICAST_LOOP so that local responders see our searches. */
    bool multicastLoop{false};
    /*! Worker thread pool limits. */
    int minThreads{2};
    int maxThreads{12};
};

/*! Flags for NpssdpInitWithOptions */
enum Npssdp_InitFlag {
    NPSSDP_FLAG_NONE = 0,
    /*! Enable IP_MULTICAST_LOOP on the search socket. */
    NPSSDP_FLAG_MULTICAST_LOOP = 1,
};

/*! Options for NpssdpInitWithOptions. The list must be terminated by
 *  NPSSDP_OPTION_END. */
enum Npssdp_InitOption {
    NPSSDP_OPTION_END = 0,
    /*! Multicast TTL. int argument. */
    NPSSDP_OPTION_TTL,
    /*! Maximum number of worker threads. int argument. */
    NPSSDP_OPTION_MAX_THREADS,
};

class SsdpDiscovery;

/*!
 * \brief Initialize the library and create the default discovery
 * coordinator.
 *
 * \param ifname interface name, or nullptr/empty for automatic selection.
 * \param port local port, 0 for an ephemeral one.
 *
 * \return NPSSDP_E_SUCCESS, NPSSDP_E_INIT if already initialized,
 *   NPSSDP_E_INIT_FAILED, NPSSDP_E_INVALID_INTERFACE.
 */
EXPORT_SPEC int NpssdpInit(const char *ifname, unsigned short port);

/*!
 * \brief Initialize with flags and a list of (option, value) pairs
 * terminated by NPSSDP_OPTION_END.
 *
 * e.g. NpssdpInitWithOptions("eth0", 0, NPSSDP_FLAG_NONE,
 *                            NPSSDP_OPTION_TTL, 4, NPSSDP_OPTION_END);
 */
EXPORT_SPEC int NpssdpInitWithOptions(
    const char *ifname, unsigned short port, unsigned int flags, ...);

/*!
 * \brief Terminate: stop all discovery, destroy the default coordinator
 * and close the log.
 *
 * \return NPSSDP_E_SUCCESS or NPSSDP_E_FINISH if not initialized.
 */
EXPORT_SPEC int NpssdpFinish();

/*!
 * \brief Return the default coordinator created by NpssdpInit(), or
 * nullptr if the library is not initialized.
 */
EXPORT_SPEC SsdpDiscovery *NpssdpGetDefaultDiscovery();

/* @} Configuration */

#endif /* NPSSDP_H */
