/* Copyright (C) 2016 J.F.Dockes
 *   This program is free software; you can redistribute it and/or modify
 *   it under the terms of the GNU Lesser General Public License as published by
 *   the Free Software Foundation; either version 2.1 of the License, or
 *   (at your option) any later version.
 *
 *   This program is distributed in the hope that it will be useful,
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *   GNU Lesser General Public License for more details.
 *
 *   You should have received a copy of the GNU Lesser General Public License
 *   along with this program; if not, write to the
 *   Free Software Foundation, Inc.,
 *   51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */
#include "npssdp.h"
#include "SsdpDiscovery.h"

#include <iostream>
#include <string>

using namespace std;

static int failures;

#define CHECK(X) do {                                                   \
        if (!(X)) {                                                     \
            cerr << __FILE__ << ":" << __LINE__ << ": check failed: " #X "\n"; \
            failures++;                                                 \
        }                                                               \
    } while (0)

int main(int, char **)
{
    CHECK(NpssdpGetDefaultDiscovery() == nullptr);
    CHECK(NpssdpFinish() == NPSSDP_E_FINISH);

    CHECK(NpssdpInitWithOptions(nullptr, 0, NPSSDP_FLAG_NONE,
                                NPSSDP_OPTION_TTL, 0, NPSSDP_OPTION_END) ==
          NPSSDP_E_INVALID_PARAM);
    CHECK(NpssdpInitWithOptions(nullptr, 0, NPSSDP_FLAG_NONE,
                                NPSSDP_OPTION_MAX_THREADS, 1, NPSSDP_OPTION_END) ==
          NPSSDP_E_INVALID_PARAM);
    CHECK(NpssdpInitWithOptions(nullptr, 0, NPSSDP_FLAG_NONE, 99, NPSSDP_OPTION_END) ==
          NPSSDP_E_INVALID_PARAM);
    CHECK(NpssdpGetDefaultDiscovery() == nullptr);

    // Sockets are only opened by the first search, so this works anywhere
    CHECK(NpssdpInitWithOptions(nullptr, 0, NPSSDP_FLAG_MULTICAST_LOOP,
                                NPSSDP_OPTION_TTL, 4, NPSSDP_OPTION_MAX_THREADS, 5,
                                NPSSDP_OPTION_END) == NPSSDP_E_SUCCESS);
    SsdpDiscovery *disco = NpssdpGetDefaultDiscovery();
    CHECK(disco != nullptr);
    CHECK(disco && disco->ok());
    CHECK(disco && !disco->transportOpen());
    CHECK(NpssdpInit(nullptr, 0) == NPSSDP_E_INIT);
    CHECK(NpssdpFinish() == NPSSDP_E_SUCCESS);
    CHECK(NpssdpGetDefaultDiscovery() == nullptr);

    CHECK(NpssdpInit("", 0) == NPSSDP_E_SUCCESS);
    CHECK(NpssdpFinish() == NPSSDP_E_SUCCESS);

    CHECK(string(NpssdpGetErrorMessage(NPSSDP_E_INVALID_INTERFACE)) ==
          "NPSSDP_E_INVALID_INTERFACE");
    CHECK(string(NpssdpGetErrorMessage(12345)) == "Unknown error code");

    if (failures) {
        cerr << failures << " failure(s)\n";
        return 1;
    }
    cout << "test_api: ok\n";
    return 0;
}
