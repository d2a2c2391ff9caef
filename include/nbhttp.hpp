/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file nbhttp.hpp
 * @brief nbhttp - non-blocking HTTP worker reactor
 *
 * Each Worker runs one poll() loop on its own thread, admits sockets up to a
 * fixed number of client slots, pushes decoded requests to a bounded work
 * queue and writes back the response a processing thread delivers.
 *
 * Usage:
 *   #include "nbhttp.hpp"
 *
 *   int main() {
 *     nbhttp::WorkQueue queue(10);
 *     nbhttp::Worker worker(0, queue);
 *     nbhttp::ProcessingPool pool(queue, [](const nbhttp::HttpRequest&) {
 *       return nbhttp::HttpResponse::text(200, "hello\n");
 *     }, 4);
 *     nbhttp::Acceptor acceptor(8080);
 *     pool.add_worker(&worker);
 *     acceptor.add_worker(&worker);
 *     pool.start();
 *     std::thread t([&] { worker.run(); });
 *     acceptor.run();
 *   }
 */

#ifndef NBHTTP_HPP_
#define NBHTTP_HPP_

#include "nbhttp/acceptor.hpp"
#include "nbhttp/admission.hpp"
#include "nbhttp/blocking_queue.hpp"
#include "nbhttp/config.hpp"
#include "nbhttp/connection.hpp"
#include "nbhttp/http.hpp"
#include "nbhttp/log.hpp"
#include "nbhttp/poller.hpp"
#include "nbhttp/processing_pool.hpp"
#include "nbhttp/response_store.hpp"
#include "nbhttp/utf8.hpp"
#include "nbhttp/vocabulary.hpp"
#include "nbhttp/worker.hpp"

#endif  // NBHTTP_HPP_
