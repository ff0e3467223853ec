/* Copyright (C) 2020 J.F.Dockes
 *
 * Redistribution and use in source and binary forms, with or without 
 * modification, are permitted provided that the following conditions are met: 
 *
 * - Redistributions of source code must retain the above copyright notice, 
 * this list of conditions and the following disclaimer. 
 * - Redistributions in binary form must reproduce the above copyright notice, 
 * this list of conditions and the following disclaimer in the documentation 
 * and/or other materials provided with the distribution. 
 * - Neither name of Intel Corporation nor the names of its contributors 
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


/* Library initialization, default coordinator and error messages */

#include "npssdp.h"

#include <cstdarg>
#include <memory>
#include <mutex>
#include <sstream>

#include "SsdpDiscovery.h"
#include "netif.h"

/* Mutex to synchronize the initialization and finish. */
static std::mutex gSDKInitMutex;
static std::unique_ptr<SsdpDiscovery> gDefaultDiscovery;

static const struct ErrorString {
    int rc;
    const char *rcError;
} ErrorMessages[] = {
    {NPSSDP_E_SUCCESS, "NPSSDP_E_SUCCESS"},
    {NPSSDP_E_INVALID_PARAM, "NPSSDP_E_INVALID_PARAM"},
    {NPSSDP_E_OUTOF_MEMORY, "NPSSDP_E_OUTOF_MEMORY"},
    {NPSSDP_E_INIT, "NPSSDP_E_INIT"},
    {NPSSDP_E_INVALID_URL, "NPSSDP_E_INVALID_URL"},
    {NPSSDP_E_BAD_RESPONSE, "NPSSDP_E_BAD_RESPONSE"},
    {NPSSDP_E_FINISH, "NPSSDP_E_FINISH"},
    {NPSSDP_E_INIT_FAILED, "NPSSDP_E_INIT_FAILED"},
    {NPSSDP_E_INVALID_INTERFACE, "NPSSDP_E_INVALID_INTERFACE"},
    {NPSSDP_E_NETWORK_ERROR, "NPSSDP_E_NETWORK_ERROR"},
    {NPSSDP_E_SOCKET_WRITE, "NPSSDP_E_SOCKET_WRITE"},
    {NPSSDP_E_SOCKET_BIND, "NPSSDP_E_SOCKET_BIND"},
    {NPSSDP_E_OUTOF_SOCKET, "NPSSDP_E_OUTOF_SOCKET"},
    {NPSSDP_E_SOCKET_ERROR, "NPSSDP_E_SOCKET_ERROR"},
    {NPSSDP_E_INTERNAL_ERROR, "NPSSDP_E_INTERNAL_ERROR"},
};

const char *NpssdpGetErrorMessage(int rc)
{
    for (const auto& ent : ErrorMessages) {
        if (ent.rc == rc) {
            return ent.rcError;
        }
    }
    return "Unknown error code";
}

static int npssdpInitCommon(const SsdpDiscoveryOptions& options)
{
    std::unique_lock<std::mutex> lck(gSDKInitMutex);

    /* Check if we're already initialized. */
    if (gDefaultDiscovery) {
        return NPSSDP_E_INIT;
    }

    int ret = NpssdpInitLog();
    if (ret != NPSSDP_E_SUCCESS) {
        return NPSSDP_E_INIT_FAILED;
    }
    NpssdpPrintf(NPSSDP_INFO, API, __FILE__, __LINE__,
                 "NpssdpInit: ifname=%s, port=%d ttl %d\n", options.ifname.c_str(),
                 static_cast<int>(options.port), options.ttl);
    {
        std::ostringstream ifdump;
        NetIF::Interfaces::theInterfaces()->print(ifdump);
        NpssdpPrintf(NPSSDP_INFO, API, __FILE__, __LINE__,
                     "All network interfaces:\n%s\n", ifdump.str().c_str());
    }

    auto discovery = std::make_unique<SsdpDiscovery>(options);
    if (!discovery->ok()) {
        NpssdpPrintf(NPSSDP_CRITICAL, API, __FILE__, __LINE__,
                     "NpssdpInit: could not create the discovery coordinator\n");
        return NPSSDP_E_INIT_FAILED;
    }
    gDefaultDiscovery = std::move(discovery);
    return NPSSDP_E_SUCCESS;
}

int NpssdpInit(const char *ifname, unsigned short port)
{
    return NpssdpInitWithOptions(ifname, port, NPSSDP_FLAG_NONE, NPSSDP_OPTION_END);
}

int NpssdpInitWithOptions(
    const char *ifname, unsigned short port, unsigned int flags, ...)
{
    va_list ap;
    int ret = NPSSDP_E_SUCCESS;
    SsdpDiscoveryOptions options;

    options.ifname = ifname ? ifname : "";
    options.port = port;
    options.multicastLoop = (flags & NPSSDP_FLAG_MULTICAST_LOOP) != 0;

    va_start(ap, flags);
    for (;;) {
        int option = static_cast<Npssdp_InitOption>(va_arg(ap, int));
        if (option == NPSSDP_OPTION_END) {
            break;
        }
        switch (option) {
        case NPSSDP_OPTION_TTL:
            options.ttl = va_arg(ap, int);
            if (options.ttl < 1 || options.ttl > 255) {
                ret = NPSSDP_E_INVALID_PARAM;
                goto breakloop;
            }
            break;
        case NPSSDP_OPTION_MAX_THREADS:
            options.maxThreads = va_arg(ap, int);
            // The timer and the receive loop each take a thread
            if (options.maxThreads < 3) {
                ret = NPSSDP_E_INVALID_PARAM;
                goto breakloop;
            }
            break;
        default:
            NpssdpPrintf(NPSSDP_CRITICAL, API, __FILE__, __LINE__,
                         "NpssdpInitWithOptions: bad option %d in list\n", option);
            ret = NPSSDP_E_INVALID_PARAM;
            goto breakloop;
        }
    }

breakloop:
    va_end(ap);
    if (ret == NPSSDP_E_SUCCESS) {
        ret = npssdpInitCommon(options);
    }
    return ret;
}

int NpssdpFinish()
{
    std::unique_ptr<SsdpDiscovery> discovery;
    {
        std::unique_lock<std::mutex> lck(gSDKInitMutex);
        if (!gDefaultDiscovery) {
            return NPSSDP_E_FINISH;
        }
        discovery = std::move(gDefaultDiscovery);
    }
    NpssdpPrintf(NPSSDP_INFO, API, __FILE__, __LINE__, "NpssdpFinish\n");
    // Stops the sessions and the threads
    discovery.reset();
    NpssdpCloseLog();
    return NPSSDP_E_SUCCESS;
}

SsdpDiscovery *NpssdpGetDefaultDiscovery()
{
    std::unique_lock<std::mutex> lck(gSDKInitMutex);
    return gDefaultDiscovery.get();
}
