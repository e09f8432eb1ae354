// =============================================================================
// quote_book_test.cpp
// =============================================================================
// Unit tests for intraday::QuoteBook.
// =============================================================================

#include "intraday/market/quote_book.hpp"
#include "intraday/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

// -----------------------------------------------------------------------------
// 1. Unknown symbol → nullopt; latest update wins.
// -----------------------------------------------------------------------------
TEST(QuoteBookTest, LatestQuotePerSymbol) {
  intraday::QuoteBook book;
  EXPECT_FALSE(book.latestQuote("NSE:SBIN-EQ").has_value());

  intraday::Quote q;
  q.ltp = 800.0;
  q.bid = 799.5;
  q.ask = 800.5;
  q.timestamp = intraday::ms_to_timestamp(1'000);
  book.update("NSE:SBIN-EQ", q);

  q.ltp = 801.0;
  q.timestamp = intraday::ms_to_timestamp(2'000);
  book.update("NSE:SBIN-EQ", q);

  intraday::Quote other;
  other.ltp = 24000.0;
  book.update("NSE:NIFTY24DECFUT", other);

  auto sbin = book.latestQuote("NSE:SBIN-EQ");
  ASSERT_TRUE(sbin.has_value());
  EXPECT_DOUBLE_EQ(sbin->ltp, 801.0);
  EXPECT_DOUBLE_EQ(sbin->bid, 799.5);
  EXPECT_EQ(intraday::timestamp_to_ms(sbin->timestamp), 2'000);

  auto nifty = book.latestQuote("NSE:NIFTY24DECFUT");
  ASSERT_TRUE(nifty.has_value());
  EXPECT_DOUBLE_EQ(nifty->ltp, 24000.0);
}

// -----------------------------------------------------------------------------
// 2. One writer (feed thread) and several readers (traders, price loop).
//    Readers only ever see quotes the writer produced (bid < ltp < ask).
// -----------------------------------------------------------------------------
TEST(QuoteBookTest, ConcurrentReadersSeeWholeQuotes) {
  intraday::QuoteBook book;
  std::atomic<bool> done{false};
  std::atomic<int> bad{0};

  std::thread writer([&] {
    for (int i = 1; i <= 5000; ++i) {
      intraday::Quote q;
      q.ltp = 100.0 + i;
      q.bid = q.ltp - 0.5;
      q.ask = q.ltp + 0.5;
      book.update("SYM", q);
    }
    done.store(true);
  });

  std::vector<std::thread> readers;
  for (int r = 0; r < 3; ++r) {
    readers.emplace_back([&] {
      while (!done.load()) {
        if (auto q = book.latestQuote("SYM")) {
          if (!(q->bid < q->ltp && q->ltp < q->ask)) {
            bad.fetch_add(1);
          }
        }
      }
    });
  }

  writer.join();
  for (auto& t : readers) t.join();

  EXPECT_EQ(bad.load(), 0);
  EXPECT_DOUBLE_EQ(book.latestQuote("SYM")->ltp, 5100.0);
}
