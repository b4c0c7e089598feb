/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
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
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#include <tessera/chain/database.hpp>
#include <tessera/chain/journal.hpp>

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/log/logger_config.hpp>
#include <fc/filesystem.hpp>

#include <boost/program_options.hpp>

#include <iostream>

using namespace tessera::chain;
namespace bpo = boost::program_options;

namespace {

void configure_console_logging( const std::string& level )
{
   fc::logging_config cfg = fc::logging_config::default_config();
   const auto log_level = fc::variant( level ).as<fc::log_level>( 1 );
   for( auto& logger : cfg.loggers )
      logger.level = log_level;
   fc::configure_logging( cfg );
}

}

int main( int argc, char** argv )
{
   try {
      bpo::options_description opts( "Tessera journal replay" );
      opts.add_options()
         ("help,h", "Print this help message and exit.")
         ("genesis-json,g", bpo::value<std::string>(), "File to read the genesis state from")
         ("journal,j", bpo::value<std::string>(), "File to read the operation journal from")
         ("log-level", bpo::value<std::string>()->default_value( "info" ),
                 "Level of the console logger (debug, info, warn, error)")
         ("print-events", "Print the events every operation emitted")
         ("stop-on-error", "Stop at the first rejected operation");

      bpo::variables_map options;
      try
      {
         bpo::store( bpo::parse_command_line( argc, argv, opts ), options );
         bpo::notify( options );
      }
      catch( const bpo::error& e )
      {
         std::cerr << "Error parsing command line: " << e.what() << "\n";
         return EXIT_FAILURE;
      }

      if( options.count( "help" ) > 0 )
      {
         std::cout << opts << "\n";
         return EXIT_SUCCESS;
      }
      if( options.count( "genesis-json" ) == 0 || options.count( "journal" ) == 0 )
      {
         std::cerr << "Both --genesis-json and --journal are required\n" << opts << "\n";
         return EXIT_FAILURE;
      }

      configure_console_logging( options.at( "log-level" ).as<std::string>() );
      journal_replay_options replay_options;
      replay_options.print_events = options.count( "print-events" ) > 0;
      replay_options.stop_on_error = options.count( "stop-on-error" ) > 0;

      const fc::path genesis_path = options.at( "genesis-json" ).as<std::string>();
      const fc::path journal_path = options.at( "journal" ).as<std::string>();
      FC_ASSERT( fc::exists( genesis_path ), "Genesis file ${f} does not exist", ("f",genesis_path) );
      FC_ASSERT( fc::exists( journal_path ), "Journal file ${f} does not exist", ("f",journal_path) );

      const auto genesis = fc::json::from_file( genesis_path ).as<genesis_state_type>( TESSERA_MAX_NESTED_OBJECTS );
      const auto journal = fc::json::from_file( journal_path )
                              .as<vector<journal_entry>>( TESSERA_MAX_NESTED_OBJECTS );

      database ledger;
      ledger.init_genesis( genesis );

      const auto summary = replay_journal( ledger, journal, replay_options, std::cout );
      return summary.rejected == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
   }
   catch( const fc::exception& e )
   {
      elog( "Exiting with error:\n${e}", ("e", e.to_detail_string()) );
      return EXIT_FAILURE;
   }
}
